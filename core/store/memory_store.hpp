#pragma once

#include <cstdint>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "i_cloud_store.hpp"

namespace cloudmock {
namespace store {

/**
 * @brief In-memory resource store backing the CloudAPI double
 *
 * Thread Safety:
 * - Read methods take a shared_lock, mutations a unique_lock
 * - All results are returned by value
 *
 * Images, packages and networks cannot be created over the API; they are
 * seeded with add_image()/add_package()/add_network() at start-up.
 *
 * Lists preserve insertion order so responses are deterministic.
 */
class MemoryStore : public ICloudStore {
public:
    MemoryStore();

    // Seeding (start-up and tests)
    void add_image(const model::Image &image);
    void add_package(const model::Package &package);
    void add_network(const model::Network &network);

    /**
     * @brief Make an operation fail until clear_failures()
     *
     * @param operation Method name, e.g. "list_keys" or "stop_machine"
     * @param message Error text returned by the failing call
     */
    void inject_failure(const std::string &operation, const std::string &message);
    void clear_failures();

    // ICloudStore
    bool list_keys(std::vector<model::Key> &keys, std::string &error) override;
    bool get_key(const std::string &name, std::optional<model::Key> &key, std::string &error) override;
    bool create_key(const std::string &name, const std::string &key, model::Key &created,
                    std::string &error) override;
    bool delete_key(const std::string &name, std::string &error) override;

    bool list_images(const model::OptionalFilters &filters, std::vector<model::Image> &images,
                     std::string &error) override;
    bool get_image(const std::string &id, std::optional<model::Image> &image, std::string &error) override;

    bool list_packages(const model::OptionalFilters &filters, std::vector<model::Package> &packages,
                       std::string &error) override;
    bool get_package(const std::string &name, std::optional<model::Package> &package, std::string &error) override;

    bool list_machines(const model::OptionalFilters &filters, std::vector<model::Machine> &machines,
                       std::string &error) override;
    bool count_machines(std::size_t &count, std::string &error) override;
    bool get_machine(const std::string &id, std::optional<model::Machine> &machine, std::string &error) override;
    bool create_machine(const model::CreateMachineRequest &request, model::Machine &created,
                        std::string &error) override;
    bool delete_machine(const std::string &id, std::string &error) override;

    bool stop_machine(const std::string &id, std::string &error) override;
    bool start_machine(const std::string &id, std::string &error) override;
    bool reboot_machine(const std::string &id, std::string &error) override;
    bool resize_machine(const std::string &id, const std::string &package, std::string &error) override;
    bool rename_machine(const std::string &id, const std::string &name, std::string &error) override;
    bool enable_machine_firewall(const std::string &id, std::string &error) override;
    bool disable_machine_firewall(const std::string &id, std::string &error) override;
    bool list_machine_firewall_rules(const std::string &machine_id, std::vector<model::FirewallRule> &rules,
                                     std::string &error) override;

    bool list_firewall_rules(std::vector<model::FirewallRule> &rules, std::string &error) override;
    bool get_firewall_rule(const std::string &id, std::optional<model::FirewallRule> &rule,
                           std::string &error) override;
    bool create_firewall_rule(const model::FirewallRuleOpts &opts, model::FirewallRule &created,
                              std::string &error) override;
    bool update_firewall_rule(const std::string &id, const model::FirewallRuleOpts &opts,
                              model::FirewallRule &updated, std::string &error) override;
    bool enable_firewall_rule(const std::string &id, model::FirewallRule &updated, std::string &error) override;
    bool disable_firewall_rule(const std::string &id, model::FirewallRule &updated, std::string &error) override;
    bool delete_firewall_rule(const std::string &id, std::string &error) override;

    bool list_networks(std::vector<model::Network> &networks, std::string &error) override;
    bool get_network(const std::string &id, std::optional<model::Network> &network, std::string &error) override;

private:
    // Helpers below expect the caller to hold mutex_
    bool injected_failure(const std::string &operation, std::string &error) const;
    model::Machine *find_machine(const std::string &id);
    model::FirewallRule *find_rule(const std::string &id);
    const model::Package *find_package(const std::string &name_or_id) const;
    const model::Image *find_image(const std::string &name_or_id) const;
    bool set_machine_state(const std::string &operation, const std::string &id, const std::string &state,
                           std::string &error);
    bool set_machine_firewall(const std::string &operation, const std::string &id, bool enabled,
                              std::string &error);
    bool set_rule_enabled(const std::string &operation, const std::string &id, bool enabled,
                          model::FirewallRule &updated, std::string &error);
    std::string generate_id();
    std::string next_private_ip();

    std::vector<model::Key> keys_;
    std::vector<model::Image> images_;
    std::vector<model::Package> packages_;
    std::vector<model::Machine> machines_;
    std::vector<model::FirewallRule> rules_;
    std::vector<model::Network> networks_;

    std::unordered_map<std::string, std::string> failures_;  // operation -> error text

    std::mt19937_64 rng_;
    uint32_t ip_counter_ = 0;

    mutable std::shared_mutex mutex_;
};

}  // namespace store
}  // namespace cloudmock
