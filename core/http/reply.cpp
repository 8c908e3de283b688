#include "reply.hpp"

#include <algorithm>
#include <cctype>

namespace cloudmock {
namespace http {

namespace {
// Byte-for-byte what the provider sends, including its unquoted key
constexpr const char *kInternalErrorBody = R"({"internalServerError":{"message":"Unkown Error",code:500}})";

Reply make_canonical(int status, const char *body, const char *error_text) {
    Reply reply;
    reply.status = status;
    reply.body = body;
    reply.content_type = kContentTypeText;
    reply.error_text = error_text;
    return reply;
}

bool same_header(const std::string &a, const std::string &b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}
}  // namespace

HeaderList Reply::wire_headers() const {
    HeaderList out;
    if (!content_type.empty()) {
        out.emplace_back(kHeaderContentType, content_type);
    }
    for (const auto &[name, value] : headers) {
        if (same_header(name, kHeaderContentLength)) {
            continue;
        }
        auto existing = std::find_if(out.begin(), out.end(),
                                     [&name](const auto &entry) { return same_header(entry.first, name); });
        if (existing != out.end()) {
            existing->second = value;
        } else {
            out.emplace_back(name, value);
        }
    }
    out.emplace_back(kHeaderContentLength, std::to_string(body.size()));
    return out;
}

const Reply &not_allowed() {
    static const Reply reply = make_canonical(kStatusMethodNotAllowed, "Method is not allowed", "MethodNotAllowedError");
    return reply;
}

const Reply &not_found() {
    static const Reply reply = make_canonical(kStatusNotFound, "Resource Not Found", "NotFoundError");
    return reply;
}

const Reply &bad_request() {
    static const Reply reply = make_canonical(kStatusBadRequest, "Malformed request url", "BadRequestError");
    return reply;
}

Reply internal_error(const std::string &error_text) {
    Reply reply;
    reply.status = kStatusInternal;
    reply.body = kInternalErrorBody;
    reply.content_type = kContentTypeJson;
    reply.error_text = error_text;
    return reply;
}

Reply dispatch_error(const std::string &method, const std::string &path) {
    return internal_error("unknown request method \"" + method + "\" for " + path);
}

Reply send_json(int status, const nlohmann::json &body) {
    Reply reply;
    try {
        // Invalid UTF-8 in stored strings becomes U+FFFD instead of failing the reply
        reply.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception &e) {
        return internal_error(std::string("JSON encoding failed: ") + e.what());
    }
    reply.status = status;
    reply.content_type = kContentTypeJson;
    return reply;
}

Reply empty_reply(int status) {
    Reply reply;
    reply.status = status;
    return reply;
}

}  // namespace http
}  // namespace cloudmock
