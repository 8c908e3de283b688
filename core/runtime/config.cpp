#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>
#include <sstream>

#include "logging/logger.hpp"

namespace cloudmock {
namespace runtime {

namespace {

// Read `node[key]` into `value` when present
template <typename T>
void read_field(const YAML::Node &node, const char *key, T &value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

void read_string_map(const YAML::Node &node, const char *key, model::StringMap &values) {
    if (!node[key]) {
        return;
    }
    for (const auto &entry : node[key]) {
        values[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
}

model::Image parse_image(const YAML::Node &node) {
    model::Image image;
    read_field(node, "id", image.id);
    read_field(node, "name", image.name);
    read_field(node, "os", image.os);
    read_field(node, "version", image.version);
    read_field(node, "type", image.type);
    read_field(node, "description", image.description);
    read_field(node, "homepage", image.homepage);
    read_field(node, "published_at", image.published_at);
    read_field(node, "public", image.is_public);
    read_field(node, "state", image.state);
    read_field(node, "eula", image.eula);
    read_string_map(node, "requirements", image.requirements);
    read_string_map(node, "tags", image.tags);
    if (node["acl"]) {
        for (const auto &entry : node["acl"]) {
            image.acl.push_back(entry.as<std::string>());
        }
    }
    return image;
}

model::Package parse_package(const YAML::Node &node) {
    model::Package pkg;
    read_field(node, "id", pkg.id);
    read_field(node, "name", pkg.name);
    read_field(node, "memory", pkg.memory);
    read_field(node, "disk", pkg.disk);
    read_field(node, "swap", pkg.swap);
    read_field(node, "vcpus", pkg.vcpus);
    read_field(node, "default", pkg.is_default);
    read_field(node, "version", pkg.version);
    read_field(node, "description", pkg.description);
    read_field(node, "group", pkg.group);
    return pkg;
}

model::Network parse_network(const YAML::Node &node) {
    model::Network network;
    read_field(node, "id", network.id);
    read_field(node, "name", network.name);
    read_field(node, "public", network.is_public);
    read_field(node, "description", network.description);
    return network;
}

model::CreateKeyOpts parse_key(const YAML::Node &node) {
    model::CreateKeyOpts key;
    read_field(node, "name", key.name);
    read_field(node, "key", key.key);
    return key;
}

// Seed entries are addressed by id/name; duplicates would shadow each other
bool check_unique(const std::vector<std::string> &ids, const std::string &what, std::string &error) {
    std::set<std::string> seen;
    for (const auto &id : ids) {
        if (id.empty()) {
            error = "seed." + what + " entry missing identifier";
            return false;
        }
        if (!seen.insert(id).second) {
            error = "Duplicate seed." + what + " identifier: '" + id + "'";
            return false;
        }
    }
    return true;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate CloudAPI settings
    if (config.cloudapi.account.empty()) {
        error = "cloudapi.account must be set";
        return false;
    }
    if (config.cloudapi.account.find('/') != std::string::npos) {
        error = "cloudapi.account must not contain '/'";
        return false;
    }

    // Validate HTTP settings
    if (config.http.port < 0 || config.http.port > 65535) {
        error = "HTTP port must be between 0 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.bind.empty()) {
        error = "HTTP bind address must not be empty";
        return false;
    }

    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    // Validate seed data
    std::vector<std::string> ids;
    for (const auto &image : config.seed.images) {
        ids.push_back(image.id);
    }
    if (!check_unique(ids, "images", error)) {
        return false;
    }

    ids.clear();
    for (const auto &pkg : config.seed.packages) {
        ids.push_back(pkg.name);
        if (pkg.memory < 0 || pkg.disk < 0 || pkg.swap < 0 || pkg.vcpus < 0) {
            error = "Package '" + pkg.name + "' has a negative size";
            return false;
        }
    }
    if (!check_unique(ids, "packages", error)) {
        return false;
    }

    ids.clear();
    for (const auto &network : config.seed.networks) {
        ids.push_back(network.id);
    }
    if (!check_unique(ids, "networks", error)) {
        return false;
    }

    ids.clear();
    for (const auto &key : config.seed.keys) {
        ids.push_back(key.name);
    }
    if (!check_unique(ids, "keys", error)) {
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"cloudapi", "http", "logging", "seed"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["cloudapi"]) {
            read_field(yaml["cloudapi"], "account", config.cloudapi.account);
        }

        if (yaml["http"]) {
            read_field(yaml["http"], "bind", config.http.bind);
            read_field(yaml["http"], "port", config.http.port);
            read_field(yaml["http"], "thread_pool_size", config.http.thread_pool_size);
        }

        if (yaml["logging"]) {
            read_field(yaml["logging"], "level", config.logging.level);
        }

        if (yaml["seed"]) {
            const auto &seed = yaml["seed"];
            // Clear first so parsing is idempotent
            config.seed = SeedConfig{};
            if (seed["images"]) {
                for (const auto &node : seed["images"]) {
                    config.seed.images.push_back(parse_image(node));
                }
            }
            if (seed["packages"]) {
                for (const auto &node : seed["packages"]) {
                    config.seed.packages.push_back(parse_package(node));
                }
            }
            if (seed["networks"]) {
                for (const auto &node : seed["networks"]) {
                    config.seed.networks.push_back(parse_network(node));
                }
            }
            if (seed["keys"]) {
                for (const auto &node : seed["keys"]) {
                    config.seed.keys.push_back(parse_key(node));
                }
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Account: " << config.cloudapi.account);
        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                   << config.http.thread_pool_size << " threads)");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        std::stringstream seed_msg;
        seed_msg << "[Config] Seed: " << config.seed.images.size() << " image(s), " << config.seed.packages.size()
                 << " package(s), " << config.seed.networks.size() << " network(s), " << config.seed.keys.size()
                 << " key(s)";
        LOG_INFO(seed_msg.str());

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace cloudmock
