#include "../cloud_api.hpp"
#include "../json.hpp"
#include "utils.hpp"

namespace cloudmock {
namespace http {

//=============================================================================
// /{account}/networks
//=============================================================================
Reply CloudApi::handle_networks(const httplib::Request &req) {
    const auto path = parse_resource_path(req.path, collection_path("networks"));
    std::string error;

    if (req.method == "GET") {
        if (path.is_collection) {
            std::vector<model::Network> networks;
            if (!store_.list_networks(networks, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_list(networks, encode_network));
        }

        std::optional<model::Network> network;
        if (!store_.get_network(path.id, network, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, encode_network(network.value_or(model::Network{})));
    }

    if (req.method == "POST" || req.method == "PUT" || req.method == "DELETE") {
        return not_allowed();
    }

    return dispatch_error(req.method, req.path);
}

}  // namespace http
}  // namespace cloudmock
