/**
 * @file resource_handlers_test.cpp
 * @brief CloudAPI handlers for keys, images, packages, networks and firewall rules
 *
 * Requests go through the real Router into a seeded MemoryStore, so route
 * matching, handler dispatch and JSON encoding are covered together.
 */

#include <gtest/gtest.h>

#include <memory>
#include <nlohmann/json.hpp>

#include "http/cloud_api.hpp"
#include "store/memory_store.hpp"
#include "test_helpers.hpp"

using namespace cloudmock;
using namespace cloudmock::http;
using cloudmock::tests::make_request;
using nlohmann::json;

class ResourceHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        tests::seed_store(store);
        api = std::make_unique<CloudApi>(tests::kAccount, store);
        router = api->build_router();
    }

    Reply send(const std::string &method, const std::string &target, const std::string &body = "") {
        return router.dispatch(make_request(method, target, body));
    }

    json send_ok(const std::string &method, const std::string &target, const std::string &body = "") {
        Reply reply = send(method, target, body);
        EXPECT_EQ(reply.status, 200) << method << " " << target << ": " << reply.error_text;
        EXPECT_EQ(reply.content_type, "application/json");
        return json::parse(reply.body);
    }

    store::MemoryStore store;
    std::unique_ptr<CloudApi> api;
    Router router;
};

//=============================================================================
// Keys
//=============================================================================

TEST_F(ResourceHandlersTest, KeysEmptyListIsArray) {
    Reply reply = send("GET", "/tester/keys");
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body, "[]");
}

TEST_F(ResourceHandlersTest, CreateKeyReturns201) {
    Reply reply = send("POST", "/tester/keys", R"({"name":"laptop","key":"ssh-rsa AAAA"})");
    ASSERT_EQ(reply.status, 201) << reply.error_text;
    json body = json::parse(reply.body);
    EXPECT_EQ(body["name"], "laptop");
    EXPECT_EQ(body["key"], "ssh-rsa AAAA");
    EXPECT_FALSE(body["fingerprint"].get<std::string>().empty());

    json listed = send_ok("GET", "/tester/keys");
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(send_ok("GET", "/tester/keys/laptop")["name"], "laptop");
}

TEST_F(ResourceHandlersTest, DeleteKeyReturns204WithEmptyBody) {
    send("POST", "/tester/keys", R"({"name":"laptop","key":"k"})");
    Reply reply = send("DELETE", "/tester/keys/laptop");
    EXPECT_EQ(reply.status, 204);
    EXPECT_TRUE(reply.body.empty());
    EXPECT_EQ(reply.wire_headers().back(), (std::pair<std::string, std::string>{"Content-Length", "0"}));
}

TEST_F(ResourceHandlersTest, DeleteUnknownKeyIsInternalError) {
    Reply reply = send("DELETE", "/tester/keys/ghost");
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.error_text, "Key ghost not found");
}

TEST_F(ResourceHandlersTest, KeyMethodsNotAllowed) {
    EXPECT_EQ(send("DELETE", "/tester/keys").status, 405);
    EXPECT_EQ(send("PUT", "/tester/keys/laptop").status, 405);
    EXPECT_EQ(send("POST", "/tester/keys/laptop").status, 405);
}

TEST_F(ResourceHandlersTest, UnknownKeyReturnsZeroValue) {
    json body = send_ok("GET", "/tester/keys/ghost");
    EXPECT_EQ(body["name"], "");
    EXPECT_EQ(body["fingerprint"], "");
}

TEST_F(ResourceHandlersTest, MalformedKeyBodyIsInternalError) {
    Reply reply = send("POST", "/tester/keys", "{oops");
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.body, R"({"internalServerError":{"message":"Unkown Error",code:500}})");
}

TEST_F(ResourceHandlersTest, UnsupportedMethodIsDispatchError) {
    Reply reply = send("PATCH", "/tester/keys");
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.error_text, "unknown request method \"PATCH\" for /tester/keys");
}

TEST_F(ResourceHandlersTest, StoreFailureBecomesInternalError) {
    store.inject_failure("list_keys", "backend down");
    Reply reply = send("GET", "/tester/keys");
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.error_text, "backend down");
}

//=============================================================================
// Images
//=============================================================================

TEST_F(ResourceHandlersTest, ListImagesWithFilters) {
    EXPECT_EQ(send_ok("GET", "/tester/images").size(), 2u);

    json filtered = send_ok("GET", "/tester/images?os=linux");
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0]["name"], "ubuntu");
    EXPECT_EQ(filtered[0]["public"], true);
}

TEST_F(ResourceHandlersTest, GetImageById) {
    json body = send_ok("GET", "/tester/images/12345678-a1a1-b2b2-c3c3-098765432100");
    EXPECT_EQ(body["name"], "base");
    EXPECT_TRUE(body["requirements"].is_object());
}

TEST_F(ResourceHandlersTest, ImageMutationsRejected) {
    EXPECT_EQ(send("POST", "/tester/images").status, 404);
    EXPECT_EQ(send("POST", "/tester/images/12345678-a1a1-b2b2-c3c3-098765432100").status, 405);
    EXPECT_EQ(send("PUT", "/tester/images").status, 405);
    EXPECT_EQ(send("DELETE", "/tester/images/12345678-a1a1-b2b2-c3c3-098765432100").status, 405);
}

//=============================================================================
// Packages
//=============================================================================

TEST_F(ResourceHandlersTest, ListAndGetPackages) {
    json all = send_ok("GET", "/tester/packages");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]["name"], "g4-highcpu-512M");

    json filtered = send_ok("GET", "/tester/packages?name=g4");
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0]["memory"], 2048);

    EXPECT_EQ(send_ok("GET", "/tester/packages/g4")["disk"], 32768);
}

TEST_F(ResourceHandlersTest, PackageMutationsRejected) {
    EXPECT_EQ(send("POST", "/tester/packages").status, 405);
    EXPECT_EQ(send("PUT", "/tester/packages/g4").status, 405);
    EXPECT_EQ(send("DELETE", "/tester/packages/g4").status, 405);
}

//=============================================================================
// Networks
//=============================================================================

TEST_F(ResourceHandlersTest, ListAndGetNetworks) {
    json all = send_ok("GET", "/tester/networks");
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0]["name"], "Test-Public");

    EXPECT_EQ(send_ok("GET", "/tester/networks/123abc4d-0011-aabb-2233-ccdd4455")["public"], true);
    EXPECT_EQ(send_ok("GET", "/tester/networks/missing")["id"], "");
}

TEST_F(ResourceHandlersTest, NetworkMutationsRejected) {
    EXPECT_EQ(send("POST", "/tester/networks").status, 405);
    EXPECT_EQ(send("DELETE", "/tester/networks/123abc4d-0011-aabb-2233-ccdd4455").status, 405);
}

//=============================================================================
// Firewall rules
//=============================================================================

TEST_F(ResourceHandlersTest, FirewallRuleLifecycle) {
    Reply created = send("POST", "/tester/fwrules", R"({"rule":"FROM any TO all vms ALLOW tcp PORT 22"})");
    ASSERT_EQ(created.status, 201) << created.error_text;
    const std::string id = json::parse(created.body)["id"];
    const std::string rule_path = "/tester/fwrules/" + id;

    EXPECT_EQ(send_ok("POST", rule_path + "/enable")["enabled"], true);
    EXPECT_EQ(send_ok("GET", rule_path)["enabled"], true);
    EXPECT_EQ(send_ok("POST", rule_path + "/disable")["enabled"], false);

    json updated = send_ok("POST", rule_path, R"({"rule":"FROM any TO all vms ALLOW tcp PORT 443","enabled":true})");
    EXPECT_EQ(updated["rule"], "FROM any TO all vms ALLOW tcp PORT 443");
    EXPECT_EQ(updated["enabled"], true);

    EXPECT_EQ(send_ok("GET", "/tester/fwrules").size(), 1u);

    Reply deleted = send("DELETE", rule_path);
    EXPECT_EQ(deleted.status, 204);
    EXPECT_TRUE(deleted.body.empty());
    EXPECT_EQ(send_ok("GET", "/tester/fwrules").dump(), "[]");
}

TEST_F(ResourceHandlersTest, EnableUnknownRuleIsInternalError) {
    Reply reply = send("POST", "/tester/fwrules/ghost/enable");
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.error_text, "Firewall rule ghost not found");
}

TEST_F(ResourceHandlersTest, FirewallRuleMethodsNotAllowed) {
    EXPECT_EQ(send("PUT", "/tester/fwrules").status, 405);
    EXPECT_EQ(send("DELETE", "/tester/fwrules").status, 405);
}

//=============================================================================
// Routing around the families
//=============================================================================

TEST_F(ResourceHandlersTest, TrailingSlashOnResourceIsNotFound) {
    EXPECT_EQ(send("GET", "/tester/keys/").status, 404);
    EXPECT_EQ(send("GET", "/tester/images/").status, 404);
}

TEST_F(ResourceHandlersTest, UnknownFamilyIsBadRequest) {
    Reply reply = send("GET", "/tester/volumes");
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(reply.body, "Malformed request url");
}

TEST_F(ResourceHandlersTest, OtherAccountIsNotFound) {
    Reply reply = send("GET", "/someone/keys");
    EXPECT_EQ(reply.status, 404);
    EXPECT_EQ(reply.body, "Resource Not Found");
}

//=============================================================================
// Encoding of stored values
//=============================================================================

TEST_F(ResourceHandlersTest, InvalidUtf8NameStillLists) {
    Reply created = send("POST", "/tester/machines", R"({"name":"web","package":"g4","image":"base"})");
    ASSERT_EQ(created.status, 201) << created.error_text;
    const std::string id = json::parse(created.body)["id"];

    // cpp-httplib hands over percent-decoded query values, so %FF arrives as a raw byte
    EXPECT_EQ(send("POST", "/tester/machines/" + id + "?action=rename&name=\xff").status, 202);

    json listed = send_ok("GET", "/tester/machines");
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0]["name"], "\xEF\xBF\xBD");
    EXPECT_EQ(send_ok("GET", "/tester/machines/" + id)["name"], "\xEF\xBF\xBD");
}

//=============================================================================
// Unseeded store
//=============================================================================

class EmptyStoreHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        api = std::make_unique<CloudApi>(tests::kAccount, store);
        router = api->build_router();
    }

    Reply send(const std::string &method, const std::string &target) {
        return router.dispatch(make_request(method, target));
    }

    store::MemoryStore store;
    std::unique_ptr<CloudApi> api;
    Router router;
};

TEST_F(EmptyStoreHandlersTest, EveryCollectionListsEmptyArray) {
    for (const char *family : {"keys", "images", "packages", "machines", "fwrules", "networks"}) {
        Reply reply = send("GET", std::string("/tester/") + family);
        EXPECT_EQ(reply.status, 200) << family << ": " << reply.error_text;
        EXPECT_EQ(reply.body, "[]") << family;
        EXPECT_EQ(reply.content_type, "application/json") << family;
    }
}

TEST_F(EmptyStoreHandlersTest, FilteredListsAreEmptyArrays) {
    EXPECT_EQ(send("GET", "/tester/images?os=linux").body, "[]");
    EXPECT_EQ(send("GET", "/tester/packages?name=g4").body, "[]");
    EXPECT_EQ(send("GET", "/tester/machines?state=running").body, "[]");
}

TEST_F(EmptyStoreHandlersTest, PutOnReadOnlyCollectionsNotAllowed) {
    EXPECT_EQ(send("PUT", "/tester/packages").status, 405);
    EXPECT_EQ(send("PUT", "/tester/networks").status, 405);
    EXPECT_EQ(send("PUT", "/tester/images").status, 405);
    EXPECT_EQ(send("PUT", "/tester/networks/123abc4d-0011-aabb-2233-ccdd4455").status, 405);
}
