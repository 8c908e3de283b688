#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace cloudmock::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "cloudmock_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, ValidMinimalConfig) {
    std::string config_content = R"(
cloudapi:
  account: tester
)";

    std::string config_path = create_config_file("minimal.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.cloudapi.account, "tester");
    // Defaults
    EXPECT_EQ(config.http.bind, "127.0.0.1");
    EXPECT_EQ(config.http.port, 8080);
    EXPECT_EQ(config.http.thread_pool_size, 8);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.seed.images.empty());
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
cloudapi:
  account: acme

http:
  bind: 0.0.0.0
  port: 0
  thread_pool_size: 4

logging:
  level: debug

seed:
  images:
    - id: img-1
      name: ubuntu
      os: linux
      version: "12.04"
      type: zvol
      public: true
      requirements:
        min_memory: "512"
      acl: [acme, other]
  packages:
    - id: pkg-1
      name: Small
      memory: 1024
      disk: 16384
      vcpus: 1
      default: true
  networks:
    - id: net-1
      name: public
      public: true
  keys:
    - name: deploy
      key: ssh-rsa AAAA deploy@ci
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.cloudapi.account, "acme");
    EXPECT_EQ(config.http.bind, "0.0.0.0");
    EXPECT_EQ(config.http.port, 0);
    EXPECT_EQ(config.http.thread_pool_size, 4);
    EXPECT_EQ(config.logging.level, "debug");

    ASSERT_EQ(config.seed.images.size(), 1u);
    EXPECT_EQ(config.seed.images[0].version, "12.04");
    EXPECT_TRUE(config.seed.images[0].is_public);
    EXPECT_EQ(config.seed.images[0].requirements.at("min_memory"), "512");
    EXPECT_EQ(config.seed.images[0].acl.size(), 2u);

    ASSERT_EQ(config.seed.packages.size(), 1u);
    EXPECT_EQ(config.seed.packages[0].memory, 1024);
    EXPECT_TRUE(config.seed.packages[0].is_default);

    ASSERT_EQ(config.seed.networks.size(), 1u);
    EXPECT_TRUE(config.seed.networks[0].is_public);

    ASSERT_EQ(config.seed.keys.size(), 1u);
    EXPECT_EQ(config.seed.keys[0].name, "deploy");
}

TEST_F(ConfigTest, MissingAccount) {
    std::string config_content = R"(
http:
  port: 8080
)";

    std::string config_path = create_config_file("no_account.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_EQ(error, "cloudapi.account must be set");
}

TEST_F(ConfigTest, AccountWithSlash) {
    std::string config_content = R"(
cloudapi:
  account: a/b
)";

    std::string config_path = create_config_file("slash.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("must not contain"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_content = R"(
cloudapi:
  account: tester

logging:
  level: verbose
)";

    std::string config_path = create_config_file("invalid_level.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_EQ(error, "Invalid log level: verbose");
}

TEST_F(ConfigTest, PortOutOfRange) {
    std::string config_content = R"(
cloudapi:
  account: tester

http:
  port: 70000
)";

    std::string config_path = create_config_file("bad_port.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("HTTP port"), std::string::npos);
}

TEST_F(ConfigTest, ZeroThreadPool) {
    std::string config_content = R"(
cloudapi:
  account: tester

http:
  thread_pool_size: 0
)";

    std::string config_path = create_config_file("bad_pool.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("thread_pool_size"), std::string::npos);
}

TEST_F(ConfigTest, DuplicateSeedImage) {
    std::string config_content = R"(
cloudapi:
  account: tester

seed:
  images:
    - id: img-1
      name: a
    - id: img-1
      name: b
)";

    std::string config_path = create_config_file("dup_image.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_EQ(error, "Duplicate seed.images identifier: 'img-1'");
}

TEST_F(ConfigTest, SeedNetworkWithoutId) {
    std::string config_content = R"(
cloudapi:
  account: tester

seed:
  networks:
    - name: orphan
)";

    std::string config_path = create_config_file("no_net_id.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_EQ(error, "seed.networks entry missing identifier");
}

TEST_F(ConfigTest, NegativePackageSize) {
    std::string config_content = R"(
cloudapi:
  account: tester

seed:
  packages:
    - id: p
      name: Broken
      memory: -1
)";

    std::string config_path = create_config_file("neg_pkg.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_EQ(error, "Package 'Broken' has a negative size");
}

TEST_F(ConfigTest, WrongValueType) {
    std::string config_content = R"(
cloudapi:
  account: tester

http:
  port: eighty
)";

    std::string config_path = create_config_file("bad_type.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Config load error"), std::string::npos);
}

TEST_F(ConfigTest, UnknownTopLevelKeyIsIgnored) {
    std::string config_content = R"(
cloudapi:
  account: tester

metrics:
  enabled: true
)";

    std::string config_path = create_config_file("unknown_key.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_content = R"(
cloudapi:
  account: [unterminated
)";

    std::string config_path = create_config_file("malformed.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}

TEST_F(ConfigTest, MissingFile) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "does_not_exist.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, ShippedExampleConfigLoads) {
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(CLOUDMOCK_EXAMPLE_CONFIG, config, error)) << "Error: " << error;
    EXPECT_EQ(config.cloudapi.account, "tester");
    EXPECT_EQ(config.seed.packages.size(), 3u);
}
