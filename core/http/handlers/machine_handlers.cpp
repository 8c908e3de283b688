#include "../../logging/logger.hpp"
#include "../cloud_api.hpp"
#include "../json.hpp"
#include "../query.hpp"
#include "utils.hpp"

namespace cloudmock {
namespace http {

namespace {
const std::string kFirewallRulesSuffix = "/fwrules";
}  // namespace

//=============================================================================
// /{account}/machines
//=============================================================================
Reply CloudApi::handle_machines(const httplib::Request &req) {
    const auto path = parse_resource_path(req.path, collection_path("machines"));
    std::string error;

    if (req.method == "GET") {
        if (path.is_collection) {
            std::vector<model::Machine> machines;
            if (!store_.list_machines(parse_filters(raw_query(req)), machines, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_list(machines, encode_machine));
        }

        if (ends_with(path.id, kFirewallRulesSuffix)) {
            std::vector<model::FirewallRule> rules;
            if (!store_.list_machine_firewall_rules(trim_suffix(path.id, kFirewallRulesSuffix), rules, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_list(rules, encode_firewall_rule));
        }

        std::optional<model::Machine> machine;
        if (!store_.get_machine(path.id, machine, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, encode_machine(machine.value_or(model::Machine{})));
    }

    if (req.method == "HEAD") {
        if (!path.is_collection) {
            return not_allowed();
        }
        std::size_t count = 0;
        if (!store_.count_machines(count, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, count);
    }

    if (req.method == "POST") {
        if (path.is_collection) {
            return create_machine(req);
        }
        return dispatch_machine_action(path.id, req);
    }

    if (req.method == "PUT") {
        return not_allowed();
    }

    if (req.method == "DELETE") {
        if (path.is_collection) {
            return not_allowed();
        }
        if (!store_.delete_machine(path.id, error)) {
            return internal_error(error);
        }
        return empty_reply(kStatusNoContent);
    }

    return dispatch_error(req.method, req.path);
}

//=============================================================================
// POST /{account}/machines
//=============================================================================
Reply CloudApi::create_machine(const httplib::Request &req) {
    std::string error;
    model::CreateMachineRequest request;
    if (!decode_create_machine_request(req.body, request, error)) {
        return internal_error(error);
    }

    model::Machine machine;
    if (!store_.create_machine(request, machine, error)) {
        return internal_error(error);
    }

    LOG_INFO("[API] Created machine " << machine.id << " (name: " << machine.name << ", package: "
                                      << machine.package << ", image: " << machine.image << ")");
    return send_json(kStatusCreated, encode_machine(machine));
}

//=============================================================================
// POST /{account}/machines/{id}?action=...
//=============================================================================
Reply CloudApi::dispatch_machine_action(const std::string &machine_id, const httplib::Request &req) {
    const auto action = parse_machine_action(req.get_param_value("action"));
    if (!action) {
        return not_allowed();
    }

    LOG_DEBUG("[API] Machine " << machine_id << " action: " << machine_action_to_string(*action));

    std::string error;
    bool ok = false;
    switch (*action) {
        case MachineAction::STOP:
            ok = store_.stop_machine(machine_id, error);
            break;
        case MachineAction::START:
            ok = store_.start_machine(machine_id, error);
            break;
        case MachineAction::REBOOT:
            ok = store_.reboot_machine(machine_id, error);
            break;
        case MachineAction::RESIZE:
            ok = store_.resize_machine(machine_id, req.get_param_value("package"), error);
            break;
        case MachineAction::RENAME:
            ok = store_.rename_machine(machine_id, req.get_param_value("name"), error);
            break;
        case MachineAction::ENABLE_FIREWALL:
            ok = store_.enable_machine_firewall(machine_id, error);
            break;
        case MachineAction::DISABLE_FIREWALL:
            ok = store_.disable_machine_firewall(machine_id, error);
            break;
    }

    if (!ok) {
        return internal_error(error);
    }
    return empty_reply(kStatusAccepted);
}

}  // namespace http
}  // namespace cloudmock
