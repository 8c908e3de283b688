#include "../../logging/logger.hpp"
#include "../cloud_api.hpp"
#include "../json.hpp"
#include "utils.hpp"

namespace cloudmock {
namespace http {

//=============================================================================
// /{account}/keys
//=============================================================================
Reply CloudApi::handle_keys(const httplib::Request &req) {
    const auto path = parse_resource_path(req.path, collection_path("keys"));
    std::string error;

    if (req.method == "GET") {
        if (path.is_collection) {
            std::vector<model::Key> keys;
            if (!store_.list_keys(keys, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_list(keys, encode_key));
        }

        std::optional<model::Key> key;
        if (!store_.get_key(path.id, key, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, encode_key(key.value_or(model::Key{})));
    }

    if (req.method == "POST") {
        if (!path.is_collection) {
            return not_allowed();
        }

        model::CreateKeyOpts opts;
        if (!decode_create_key_opts(req.body, opts, error)) {
            return internal_error(error);
        }
        model::Key created;
        if (!store_.create_key(opts.name, opts.key, created, error)) {
            return internal_error(error);
        }
        LOG_INFO("[API] Created key '" << created.name << "'");
        return send_json(kStatusCreated, encode_key(created));
    }

    if (req.method == "PUT") {
        return not_allowed();
    }

    if (req.method == "DELETE") {
        if (path.is_collection) {
            return not_allowed();
        }
        if (!store_.delete_key(path.id, error)) {
            return internal_error(error);
        }
        return empty_reply(kStatusNoContent);
    }

    return dispatch_error(req.method, req.path);
}

}  // namespace http
}  // namespace cloudmock
