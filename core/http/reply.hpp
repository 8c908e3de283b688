#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace cloudmock {
namespace http {

// HTTP status codes used by the CloudAPI contract
constexpr int kStatusOk = 200;
constexpr int kStatusCreated = 201;
constexpr int kStatusAccepted = 202;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;

constexpr const char *kContentTypeJson = "application/json";
constexpr const char *kContentTypeText = "text/plain; charset=UTF-8";

constexpr const char *kHeaderContentType = "Content-Type";
constexpr const char *kHeaderContentLength = "Content-Length";

// Header name/value pairs in the order they are written
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Rendered outcome of one API request
 *
 * Every handler returns a Reply, whether it succeeded or failed. error_text is
 * diagnostic only (logged, inspected by tests) and never written to the wire.
 */
struct Reply {
    int status = kStatusOk;
    std::string body;
    std::string content_type;
    std::string error_text;
    std::map<std::string, std::string> headers;

    bool is_error() const { return status >= kStatusBadRequest; }

    /**
     * @brief Headers in the order they are applied to the response
     *
     * Content-Type (only if non-empty), then the extra headers, then
     * Content-Length computed from the body byte length. Names are unique
     * (case-insensitive): an extra header overrides an earlier entry of the
     * same name, and Content-Length always comes from the body.
     */
    HeaderList wire_headers() const;
};

// Canonical failures, shared and immutable for the process lifetime
const Reply &not_allowed();
const Reply &not_found();
const Reply &bad_request();

// 500 with the fixed CloudAPI error envelope; error_text keeps the cause
Reply internal_error(const std::string &error_text);

// Method/path combination no handler knows about (rendered as 500)
Reply dispatch_error(const std::string &method, const std::string &path);

// JSON-encode `body` with `status`; encoding failures become internal_error()
Reply send_json(int status, const nlohmann::json &body);

// Status-only reply with an empty body (202 actions, 204 deletes)
Reply empty_reply(int status);

}  // namespace http
}  // namespace cloudmock
