#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <httplib.h>

#include "reply.hpp"

namespace cloudmock {
namespace http {

using Handler = std::function<Reply(const httplib::Request &)>;

/**
 * @brief Immutable path -> handler table with servemux matching rules
 *
 * - A pattern without a trailing slash matches only that exact path
 * - A pattern ending in '/' matches itself and every path below it
 * - Exact matches win; otherwise the longest matching '/' pattern wins
 *
 * Built once by RouterBuilder; dispatch() is safe to call concurrently.
 */
class Router {
public:
    Reply dispatch(const httplib::Request &req) const;

    // Pattern that would serve `path`, if any
    std::optional<std::string> match(const std::string &path) const;

    std::vector<std::string> patterns() const;

private:
    friend class RouterBuilder;

    const Handler *find(const std::string &path, std::string *pattern) const;

    std::map<std::string, Handler> routes_;
};

/**
 * @brief Registers routes under an account-scoped prefix
 *
 * Patterns may contain the "{account}" placeholder, resolved once here.
 * Every pattern not ending in '/' is registered a second time with a
 * trailing slash pointing at the same handler.
 */
class RouterBuilder {
public:
    static constexpr const char *kAccountPlaceholder = "{account}";

    explicit RouterBuilder(std::string account);

    // Serve a fixed reply (root not-found, account bad-request)
    RouterBuilder &add_reply(const std::string &pattern, const Reply &reply);

    // Serve a resource family; paths ending in '/' are rejected as not-found
    RouterBuilder &add_resource(const std::string &pattern, Handler handler);

    Router build();

private:
    std::string resolve(const std::string &pattern) const;
    void add(const std::string &pattern, const Handler &handler);

    std::string account_;
    Router router_;
};

// Raw (undecoded) query string of the request target, without the '?'
std::string raw_query(const httplib::Request &req);

}  // namespace http
}  // namespace cloudmock
