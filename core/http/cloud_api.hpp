#pragma once

#include <optional>
#include <string>
#include <httplib.h>

#include "reply.hpp"
#include "router.hpp"
#include "store/i_cloud_store.hpp"

namespace cloudmock {
namespace http {

// Lifecycle commands accepted by POST /{account}/machines/{id}?action=...
enum class MachineAction { STOP, START, REBOOT, RESIZE, RENAME, ENABLE_FIREWALL, DISABLE_FIREWALL };

// Maps an `action` query value to a command, checked in the order above
std::optional<MachineAction> parse_machine_action(const std::string &action);
const char *machine_action_to_string(MachineAction action);

/**
 * @brief CloudAPI resource handlers
 *
 * One handler per resource family. Each receives the raw request, decides
 * the operation from method + path suffix (+ query for machine actions),
 * calls the store and returns a Reply. Store and decode failures come back
 * as internal_error() with the cause in Reply::error_text.
 *
 * Endpoints (all under /{account}):
 * - /keys       GET list/get, POST create, DELETE {id}
 * - /images     GET list (filters)/get
 * - /packages   GET list (filters)/get
 * - /machines   GET list (filters)/get/{id}/fwrules, HEAD count, POST create/action, DELETE {id}
 * - /fwrules    GET list/get, POST create/update/{id}/enable/{id}/disable, DELETE {id}
 * - /networks   GET list/get
 *
 * Implementations live in handlers/*.cpp, one file per family.
 */
class CloudApi {
public:
    CloudApi(std::string account, store::ICloudStore &store);

    const std::string &account() const { return account_; }

    // Route table for this account: "/", "/{account}/" and the six families
    Router build_router();

    Reply handle_keys(const httplib::Request &req);
    Reply handle_images(const httplib::Request &req);
    Reply handle_packages(const httplib::Request &req);
    Reply handle_machines(const httplib::Request &req);
    Reply handle_firewall_rules(const httplib::Request &req);
    Reply handle_networks(const httplib::Request &req);

private:
    // "/{account}/{family}"
    std::string collection_path(const char *family) const;

    Reply create_machine(const httplib::Request &req);
    Reply dispatch_machine_action(const std::string &machine_id, const httplib::Request &req);

    std::string account_;
    store::ICloudStore &store_;
};

}  // namespace http
}  // namespace cloudmock
