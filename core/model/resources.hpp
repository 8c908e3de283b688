#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cloudmock {
namespace model {

// Query-string filters; std::nullopt means "no query string at all"
using Filters = std::map<std::string, std::string>;
using OptionalFilters = std::optional<Filters>;

using StringMap = std::map<std::string, std::string>;

struct Key {
    std::string name;
    std::string fingerprint;
    std::string key;
};

struct Image {
    std::string id;
    std::string name;
    std::string os;
    std::string version;
    std::string type;
    std::string description;
    StringMap requirements;
    std::string homepage;
    std::string published_at;
    bool is_public = false;
    std::string state;
    StringMap tags;
    std::string eula;
    std::vector<std::string> acl;
};

struct Package {
    std::string name;
    int memory = 0;  // MiB
    int disk = 0;    // MiB
    int swap = 0;    // MiB
    int vcpus = 0;
    bool is_default = false;
    std::string id;
    std::string version;
    std::string description;
    std::string group;
};

struct Machine {
    std::string id;
    std::string name;
    std::string type;   // smartmachine | virtualmachine
    std::string state;  // running | stopped
    std::string dataset;
    int memory = 0;
    int disk = 0;
    std::vector<std::string> ips;
    StringMap metadata;
    StringMap tags;
    std::string created;
    std::string updated;
    std::string package;
    std::string image;
    std::string primary_ip;
    std::vector<std::string> networks;
    bool firewall_enabled = false;
};

struct FirewallRule {
    std::string id;
    bool enabled = false;
    std::string rule;
};

struct Network {
    std::string id;
    std::string name;
    bool is_public = false;
    std::string description;
};

// Request bodies

struct CreateKeyOpts {
    std::string name;
    std::string key;
};

// Shared by firewall rule create and update
struct FirewallRuleOpts {
    std::string rule;
    bool enabled = false;
};

/**
 * @brief Decoded machine-create body
 *
 * name/package/image are empty when absent. networks stays unset when the
 * body has no "networks" key so the store can apply its default.
 * "tag.<k>" and "metadata.<k>" keys land in tags[k] / metadata[k].
 */
struct CreateMachineRequest {
    std::string name;
    std::string package;
    std::string image;
    std::optional<std::vector<std::string>> networks;
    StringMap metadata;
    StringMap tags;
};

}  // namespace model
}  // namespace cloudmock
