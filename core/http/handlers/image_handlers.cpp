#include "../cloud_api.hpp"
#include "../json.hpp"
#include "../query.hpp"
#include "utils.hpp"

namespace cloudmock {
namespace http {

//=============================================================================
// /{account}/images
//=============================================================================
Reply CloudApi::handle_images(const httplib::Request &req) {
    const auto path = parse_resource_path(req.path, collection_path("images"));
    std::string error;

    if (req.method == "GET") {
        if (path.is_collection) {
            std::vector<model::Image> images;
            if (!store_.list_images(parse_filters(raw_query(req)), images, error)) {
                return internal_error(error);
            }
            return send_json(kStatusOk, encode_list(images, encode_image));
        }

        std::optional<model::Image> image;
        if (!store_.get_image(path.id, image, error)) {
            return internal_error(error);
        }
        return send_json(kStatusOk, encode_image(image.value_or(model::Image{})));
    }

    if (req.method == "POST") {
        // Creating an image from a machine is not offered by the double
        if (path.is_collection) {
            return not_found();
        }
        return not_allowed();
    }

    if (req.method == "PUT" || req.method == "DELETE") {
        return not_allowed();
    }

    return dispatch_error(req.method, req.path);
}

}  // namespace http
}  // namespace cloudmock
