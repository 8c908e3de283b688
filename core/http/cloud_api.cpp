#include "cloud_api.hpp"

#include "logging/logger.hpp"

namespace cloudmock {
namespace http {

namespace {
struct ActionName {
    MachineAction action;
    const char *name;
};

// Dispatch priority order
constexpr ActionName kActions[] = {
    {MachineAction::STOP, "stop"},
    {MachineAction::START, "start"},
    {MachineAction::REBOOT, "reboot"},
    {MachineAction::RESIZE, "resize"},
    {MachineAction::RENAME, "rename"},
    {MachineAction::ENABLE_FIREWALL, "enable_firewall"},
    {MachineAction::DISABLE_FIREWALL, "disable_firewall"},
};
}  // namespace

std::optional<MachineAction> parse_machine_action(const std::string &action) {
    for (const auto &entry : kActions) {
        if (action == entry.name) {
            return entry.action;
        }
    }
    return std::nullopt;
}

const char *machine_action_to_string(MachineAction action) {
    for (const auto &entry : kActions) {
        if (entry.action == action) {
            return entry.name;
        }
    }
    return "unknown";
}

CloudApi::CloudApi(std::string account, store::ICloudStore &store) : account_(std::move(account)), store_(store) {}

std::string CloudApi::collection_path(const char *family) const { return "/" + account_ + "/" + family; }

Router CloudApi::build_router() {
    RouterBuilder builder(account_);
    builder.add_reply("/", not_found())
        .add_reply("/{account}/", bad_request())
        .add_resource("/{account}/keys", [this](const httplib::Request &req) { return handle_keys(req); })
        .add_resource("/{account}/images", [this](const httplib::Request &req) { return handle_images(req); })
        .add_resource("/{account}/packages", [this](const httplib::Request &req) { return handle_packages(req); })
        .add_resource("/{account}/machines", [this](const httplib::Request &req) { return handle_machines(req); })
        .add_resource("/{account}/fwrules",
                      [this](const httplib::Request &req) { return handle_firewall_rules(req); })
        .add_resource("/{account}/networks", [this](const httplib::Request &req) { return handle_networks(req); });

    LOG_INFO("[HTTP] Routes configured for account '" << account_ << "':");
    LOG_INFO("[HTTP]   /" << account_ << "/keys");
    LOG_INFO("[HTTP]   /" << account_ << "/images");
    LOG_INFO("[HTTP]   /" << account_ << "/packages");
    LOG_INFO("[HTTP]   /" << account_ << "/machines");
    LOG_INFO("[HTTP]   /" << account_ << "/fwrules");
    LOG_INFO("[HTTP]   /" << account_ << "/networks");
    return builder.build();
}

}  // namespace http
}  // namespace cloudmock
