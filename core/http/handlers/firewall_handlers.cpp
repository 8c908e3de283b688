#include "../../logging/logger.hpp"
#include "../cloud_api.hpp"
#include "../json.hpp"
#include "utils.hpp"

namespace cloudmock {
namespace http {

namespace {
const std::string kEnableSuffix = "/enable";
const std::string kDisableSuffix = "/disable";
}  // namespace

//=============================================================================
// /{account}/fwrules
//=============================================================================
Reply CloudApi::handle_firewall_rules(const httplib::Request &req) {
    const auto path = parse_resource_path(req.path, collection_path("fwrules"));
    std::string error;

    if (req.method == "GET") {
        if (path.is_collection) {
            std::vector<model::FirewallRule> rules;
            if (!store_.list_firewall_rules(rules, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_list(rules, encode_firewall_rule));
        }

        std::optional<model::FirewallRule> rule;
        if (!store_.get_firewall_rule(path.id, rule, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, encode_firewall_rule(rule.value_or(model::FirewallRule{})));
    }

    if (req.method == "POST") {
        model::FirewallRule rule;

        if (path.is_collection) {
            model::FirewallRuleOpts opts;
            if (!decode_firewall_rule_opts(req.body, opts, error)) {
                return internal_error(error);
            }
            if (!store_.create_firewall_rule(opts, rule, error)) {
                return internal_error(error);
            }
            LOG_INFO("[API] Created firewall rule " << rule.id);
            return send_json(kStatusCreated, encode_firewall_rule(rule));
        }

        if (ends_with(path.id, kEnableSuffix)) {
            if (!store_.enable_firewall_rule(trim_suffix(path.id, kEnableSuffix), rule, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_firewall_rule(rule));
        }

        if (ends_with(path.id, kDisableSuffix)) {
            if (!store_.disable_firewall_rule(trim_suffix(path.id, kDisableSuffix), rule, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_firewall_rule(rule));
        }

        // Any other single-rule POST is an update
        model::FirewallRuleOpts opts;
        if (!decode_firewall_rule_opts(req.body, opts, error)) {
            return internal_error(error);
        }
        if (!store_.update_firewall_rule(path.id, opts, rule, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, encode_firewall_rule(rule));
    }

    if (req.method == "PUT") {
        return not_allowed();
    }

    if (req.method == "DELETE") {
        if (path.is_collection) {
            return not_allowed();
        }
        if (!store_.delete_firewall_rule(path.id, error)) {
            return internal_error(error);
        }
        return empty_reply(kStatusNoContent);
    }

    return dispatch_error(req.method, req.path);
}

}  // namespace http
}  // namespace cloudmock
