#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "model/resources.hpp"

namespace cloudmock {
namespace store {

// Interface for the resource store behind the HTTP layer (enables mocking)
//
// Every operation returns false and fills `error` on failure. Single-resource
// lookups succeed with an empty optional when the id is unknown.
class ICloudStore {
public:
    virtual ~ICloudStore() = default;

    // Keys
    virtual bool list_keys(std::vector<model::Key> &keys, std::string &error) = 0;
    virtual bool get_key(const std::string &name, std::optional<model::Key> &key, std::string &error) = 0;
    virtual bool create_key(const std::string &name, const std::string &key, model::Key &created,
                            std::string &error) = 0;
    virtual bool delete_key(const std::string &name, std::string &error) = 0;

    // Images
    virtual bool list_images(const model::OptionalFilters &filters, std::vector<model::Image> &images,
                             std::string &error) = 0;
    virtual bool get_image(const std::string &id, std::optional<model::Image> &image, std::string &error) = 0;

    // Packages
    virtual bool list_packages(const model::OptionalFilters &filters, std::vector<model::Package> &packages,
                               std::string &error) = 0;
    virtual bool get_package(const std::string &name, std::optional<model::Package> &package,
                             std::string &error) = 0;

    // Machines
    virtual bool list_machines(const model::OptionalFilters &filters, std::vector<model::Machine> &machines,
                               std::string &error) = 0;
    virtual bool count_machines(std::size_t &count, std::string &error) = 0;
    virtual bool get_machine(const std::string &id, std::optional<model::Machine> &machine, std::string &error) = 0;
    virtual bool create_machine(const model::CreateMachineRequest &request, model::Machine &created,
                                std::string &error) = 0;
    virtual bool delete_machine(const std::string &id, std::string &error) = 0;

    // Machine lifecycle
    virtual bool stop_machine(const std::string &id, std::string &error) = 0;
    virtual bool start_machine(const std::string &id, std::string &error) = 0;
    virtual bool reboot_machine(const std::string &id, std::string &error) = 0;
    virtual bool resize_machine(const std::string &id, const std::string &package, std::string &error) = 0;
    virtual bool rename_machine(const std::string &id, const std::string &name, std::string &error) = 0;
    virtual bool enable_machine_firewall(const std::string &id, std::string &error) = 0;
    virtual bool disable_machine_firewall(const std::string &id, std::string &error) = 0;
    virtual bool list_machine_firewall_rules(const std::string &machine_id, std::vector<model::FirewallRule> &rules,
                                             std::string &error) = 0;

    // Firewall rules
    virtual bool list_firewall_rules(std::vector<model::FirewallRule> &rules, std::string &error) = 0;
    virtual bool get_firewall_rule(const std::string &id, std::optional<model::FirewallRule> &rule,
                                   std::string &error) = 0;
    virtual bool create_firewall_rule(const model::FirewallRuleOpts &opts, model::FirewallRule &created,
                                      std::string &error) = 0;
    virtual bool update_firewall_rule(const std::string &id, const model::FirewallRuleOpts &opts,
                                      model::FirewallRule &updated, std::string &error) = 0;
    virtual bool enable_firewall_rule(const std::string &id, model::FirewallRule &updated, std::string &error) = 0;
    virtual bool disable_firewall_rule(const std::string &id, model::FirewallRule &updated, std::string &error) = 0;
    virtual bool delete_firewall_rule(const std::string &id, std::string &error) = 0;

    // Networks
    virtual bool list_networks(std::vector<model::Network> &networks, std::string &error) = 0;
    virtual bool get_network(const std::string &id, std::optional<model::Network> &network, std::string &error) = 0;
};

}  // namespace store
}  // namespace cloudmock
