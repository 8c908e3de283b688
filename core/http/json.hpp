#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "model/resources.hpp"

namespace cloudmock {
namespace http {

/**
 * @brief JSON encoding for CloudAPI resources
 *
 * Field names follow the provider wire contract. Maps always encode as
 * objects and sequences as arrays, even when empty, so a zero-value resource
 * never contains null.
 */
nlohmann::json encode_key(const model::Key &key);
nlohmann::json encode_image(const model::Image &image);
nlohmann::json encode_package(const model::Package &package);
nlohmann::json encode_machine(const model::Machine &machine);
nlohmann::json encode_firewall_rule(const model::FirewallRule &rule);
nlohmann::json encode_network(const model::Network &network);

// Encode a collection; an empty input yields [] rather than null
template <typename T, typename Encoder>
nlohmann::json encode_list(const std::vector<T> &items, Encoder encode) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &item : items) {
        out.push_back(encode(item));
    }
    return out;
}

// Decode functions for request bodies. An empty body decodes to defaults.
bool decode_create_key_opts(const std::string &body, model::CreateKeyOpts &opts, std::string &error);
bool decode_firewall_rule_opts(const std::string &body, model::FirewallRuleOpts &opts, std::string &error);

/**
 * @brief Decode a machine-create body
 *
 * Recognized keys: "name", "package", "image" (strings), "networks" (array of
 * strings), "tag.<k>" and "metadata.<k>" (strings). Other keys are ignored
 * and null values are skipped. Any other type mismatch is an error naming
 * the offending key.
 */
bool decode_create_machine_request(const std::string &body, model::CreateMachineRequest &request,
                                   std::string &error);

}  // namespace http
}  // namespace cloudmock
