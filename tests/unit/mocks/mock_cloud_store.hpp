#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "store/i_cloud_store.hpp"

namespace cloudmock::tests {

using namespace testing;

class MockCloudStore : public store::ICloudStore {
public:
    MOCK_METHOD(bool, list_keys, (std::vector<model::Key> &, std::string &), (override));
    MOCK_METHOD(bool, get_key, (const std::string &, std::optional<model::Key> &, std::string &), (override));
    MOCK_METHOD(bool, create_key, (const std::string &, const std::string &, model::Key &, std::string &),
                (override));
    MOCK_METHOD(bool, delete_key, (const std::string &, std::string &), (override));

    MOCK_METHOD(bool, list_images, (const model::OptionalFilters &, std::vector<model::Image> &, std::string &),
                (override));
    MOCK_METHOD(bool, get_image, (const std::string &, std::optional<model::Image> &, std::string &), (override));

    MOCK_METHOD(bool, list_packages, (const model::OptionalFilters &, std::vector<model::Package> &, std::string &),
                (override));
    MOCK_METHOD(bool, get_package, (const std::string &, std::optional<model::Package> &, std::string &),
                (override));

    MOCK_METHOD(bool, list_machines, (const model::OptionalFilters &, std::vector<model::Machine> &, std::string &),
                (override));
    MOCK_METHOD(bool, count_machines, (std::size_t &, std::string &), (override));
    MOCK_METHOD(bool, get_machine, (const std::string &, std::optional<model::Machine> &, std::string &),
                (override));
    MOCK_METHOD(bool, create_machine, (const model::CreateMachineRequest &, model::Machine &, std::string &),
                (override));
    MOCK_METHOD(bool, delete_machine, (const std::string &, std::string &), (override));

    MOCK_METHOD(bool, stop_machine, (const std::string &, std::string &), (override));
    MOCK_METHOD(bool, start_machine, (const std::string &, std::string &), (override));
    MOCK_METHOD(bool, reboot_machine, (const std::string &, std::string &), (override));
    MOCK_METHOD(bool, resize_machine, (const std::string &, const std::string &, std::string &), (override));
    MOCK_METHOD(bool, rename_machine, (const std::string &, const std::string &, std::string &), (override));
    MOCK_METHOD(bool, enable_machine_firewall, (const std::string &, std::string &), (override));
    MOCK_METHOD(bool, disable_machine_firewall, (const std::string &, std::string &), (override));
    MOCK_METHOD(bool, list_machine_firewall_rules,
                (const std::string &, std::vector<model::FirewallRule> &, std::string &), (override));

    MOCK_METHOD(bool, list_firewall_rules, (std::vector<model::FirewallRule> &, std::string &), (override));
    MOCK_METHOD(bool, get_firewall_rule, (const std::string &, std::optional<model::FirewallRule> &, std::string &),
                (override));
    MOCK_METHOD(bool, create_firewall_rule, (const model::FirewallRuleOpts &, model::FirewallRule &, std::string &),
                (override));
    MOCK_METHOD(bool, update_firewall_rule,
                (const std::string &, const model::FirewallRuleOpts &, model::FirewallRule &, std::string &),
                (override));
    MOCK_METHOD(bool, enable_firewall_rule, (const std::string &, model::FirewallRule &, std::string &), (override));
    MOCK_METHOD(bool, disable_firewall_rule, (const std::string &, model::FirewallRule &, std::string &),
                (override));
    MOCK_METHOD(bool, delete_firewall_rule, (const std::string &, std::string &), (override));

    MOCK_METHOD(bool, list_networks, (std::vector<model::Network> &, std::string &), (override));
    MOCK_METHOD(bool, get_network, (const std::string &, std::optional<model::Network> &, std::string &),
                (override));
};

}  // namespace cloudmock::tests
