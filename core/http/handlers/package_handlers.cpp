#include "../cloud_api.hpp"
#include "../json.hpp"
#include "../query.hpp"
#include "utils.hpp"

namespace cloudmock {
namespace http {

//=============================================================================
// /{account}/packages
//=============================================================================
Reply CloudApi::handle_packages(const httplib::Request &req) {
    const auto path = parse_resource_path(req.path, collection_path("packages"));
    std::string error;

    if (req.method == "GET") {
        if (path.is_collection) {
            std::vector<model::Package> packages;
            if (!store_.list_packages(parse_filters(raw_query(req)), packages, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_list(packages, encode_package));
        }

        std::optional<model::Package> package;
        if (!store_.get_package(path.id, package, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, encode_package(package.value_or(model::Package{})));
    }

    if (req.method == "POST" || req.method == "PUT" || req.method == "DELETE") {
        return not_allowed();
    }

    return dispatch_error(req.method, req.path);
}

}  // namespace http
}  // namespace cloudmock
