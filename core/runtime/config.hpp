#pragma once

#include <string>
#include <vector>

#include "model/resources.hpp"

namespace cloudmock {
namespace runtime {

struct CloudApiConfig {
    std::string account;  // Path prefix for every resource route (required)
};

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8080;                 // HTTP port (0 = ephemeral)
    int thread_pool_size = 8;        // Worker thread pool size
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Resources that cannot be created over the API, loaded at start-up
struct SeedConfig {
    std::vector<model::Image> images;
    std::vector<model::Package> packages;
    std::vector<model::Network> networks;
    std::vector<model::CreateKeyOpts> keys;
};

struct RuntimeConfig {
    CloudApiConfig cloudapi;
    HttpConfig http;
    LoggingConfig logging;
    SeedConfig seed;
};

// Loads configuration from a YAML file (validates before returning)
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace cloudmock
