#include "json.hpp"

namespace cloudmock {
namespace http {

namespace {
constexpr const char *kTagPrefix = "tag.";
constexpr const char *kMetadataPrefix = "metadata.";

bool starts_with(const std::string &s, const std::string &prefix) { return s.compare(0, prefix.size(), prefix) == 0; }

nlohmann::json encode_string_map(const model::StringMap &values) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto &[key, value] : values) {
        out[key] = value;
    }
    return out;
}

// Parse a body that must be a JSON object; empty bodies leave `out` null
bool parse_object(const std::string &body, nlohmann::json &out, std::string &error) {
    if (body.empty()) {
        out = nullptr;
        return true;
    }
    try {
        out = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        error = std::string("Request body must be a JSON object, got ") + out.type_name();
        return false;
    }
    return true;
}

// Optional string field: missing/null leaves `value` untouched
bool read_string(const nlohmann::json &obj, const char *key, std::string &value, std::string &error) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        error = std::string("Field '") + key + "' must be a string, got " + it->type_name();
        return false;
    }
    value = it->get<std::string>();
    return true;
}

bool read_bool(const nlohmann::json &obj, const char *key, bool &value, std::string &error) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_boolean()) {
        error = std::string("Field '") + key + "' must be a boolean, got " + it->type_name();
        return false;
    }
    value = it->get<bool>();
    return true;
}
}  // namespace

//=============================================================================
// Encoders
//=============================================================================

nlohmann::json encode_key(const model::Key &key) {
    return {{"name", key.name}, {"fingerprint", key.fingerprint}, {"key", key.key}};
}

nlohmann::json encode_image(const model::Image &image) {
    return {{"id", image.id},
            {"name", image.name},
            {"os", image.os},
            {"version", image.version},
            {"type", image.type},
            {"description", image.description},
            {"requirements", encode_string_map(image.requirements)},
            {"homepage", image.homepage},
            {"published_at", image.published_at},
            {"public", image.is_public},
            {"state", image.state},
            {"tags", encode_string_map(image.tags)},
            {"eula", image.eula},
            {"acl", nlohmann::json(image.acl)}};
}

nlohmann::json encode_package(const model::Package &package) {
    return {{"name", package.name},       {"memory", package.memory},   {"disk", package.disk},
            {"swap", package.swap},       {"vcpus", package.vcpus},     {"default", package.is_default},
            {"id", package.id},           {"version", package.version}, {"description", package.description},
            {"group", package.group}};
}

nlohmann::json encode_machine(const model::Machine &machine) {
    return {{"id", machine.id},
            {"name", machine.name},
            {"type", machine.type},
            {"state", machine.state},
            {"dataset", machine.dataset},
            {"memory", machine.memory},
            {"disk", machine.disk},
            {"ips", nlohmann::json(machine.ips)},
            {"metadata", encode_string_map(machine.metadata)},
            {"tags", encode_string_map(machine.tags)},
            {"created", machine.created},
            {"updated", machine.updated},
            {"package", machine.package},
            {"image", machine.image},
            {"primaryIp", machine.primary_ip},
            {"networks", nlohmann::json(machine.networks)},
            {"firewall_enabled", machine.firewall_enabled}};
}

nlohmann::json encode_firewall_rule(const model::FirewallRule &rule) {
    return {{"id", rule.id}, {"enabled", rule.enabled}, {"rule", rule.rule}};
}

nlohmann::json encode_network(const model::Network &network) {
    return {{"id", network.id},
            {"name", network.name},
            {"public", network.is_public},
            {"description", network.description}};
}

//=============================================================================
// Decoders
//=============================================================================

bool decode_create_key_opts(const std::string &body, model::CreateKeyOpts &opts, std::string &error) {
    nlohmann::json json;
    if (!parse_object(body, json, error)) {
        return false;
    }
    if (json.is_null()) {
        return true;
    }
    return read_string(json, "name", opts.name, error) && read_string(json, "key", opts.key, error);
}

bool decode_firewall_rule_opts(const std::string &body, model::FirewallRuleOpts &opts, std::string &error) {
    nlohmann::json json;
    if (!parse_object(body, json, error)) {
        return false;
    }
    if (json.is_null()) {
        return true;
    }
    return read_string(json, "rule", opts.rule, error) && read_bool(json, "enabled", opts.enabled, error);
}

bool decode_create_machine_request(const std::string &body, model::CreateMachineRequest &request,
                                   std::string &error) {
    nlohmann::json json;
    if (!parse_object(body, json, error)) {
        return false;
    }
    if (json.is_null()) {
        return true;
    }

    for (const auto &[key, value] : json.items()) {
        if (value.is_null()) {
            continue;
        }

        if (key == "name" || key == "package" || key == "image") {
            std::string &target = key == "name" ? request.name : key == "package" ? request.package : request.image;
            if (!read_string(json, key.c_str(), target, error)) {
                return false;
            }
        } else if (key == "networks") {
            if (!value.is_array()) {
                error = std::string("Field 'networks' must be an array of strings, got ") + value.type_name();
                return false;
            }
            std::vector<std::string> networks;
            for (const auto &net : value) {
                if (!net.is_string()) {
                    error = std::string("Field 'networks' must only contain strings, got ") + net.type_name();
                    return false;
                }
                networks.push_back(net.get<std::string>());
            }
            request.networks = std::move(networks);
        } else if (starts_with(key, kTagPrefix) || starts_with(key, kMetadataPrefix)) {
            if (!value.is_string()) {
                error = "Field '" + key + "' must be a string, got " + value.type_name();
                return false;
            }
            if (starts_with(key, kTagPrefix)) {
                request.tags[key.substr(std::char_traits<char>::length(kTagPrefix))] = value.get<std::string>();
            } else {
                request.metadata[key.substr(std::char_traits<char>::length(kMetadataPrefix))] =
                    value.get<std::string>();
            }
        }
    }
    return true;
}

}  // namespace http
}  // namespace cloudmock
