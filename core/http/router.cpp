#include "router.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace cloudmock {
namespace http {

//=============================================================================
// Router
//=============================================================================

const Handler *Router::find(const std::string &path, std::string *pattern) const {
    auto exact = routes_.find(path);
    if (exact != routes_.end()) {
        if (pattern != nullptr) {
            *pattern = exact->first;
        }
        return &exact->second;
    }

    const Handler *best = nullptr;
    std::size_t best_len = 0;
    for (const auto &[candidate, handler] : routes_) {
        if (candidate.empty() || candidate.back() != '/') {
            continue;
        }
        if (candidate.size() > best_len && path.compare(0, candidate.size(), candidate) == 0) {
            best = &handler;
            best_len = candidate.size();
            if (pattern != nullptr) {
                *pattern = candidate;
            }
        }
    }
    return best;
}

std::optional<std::string> Router::match(const std::string &path) const {
    std::string pattern;
    if (find(path, &pattern) == nullptr) {
        return std::nullopt;
    }
    return pattern;
}

std::vector<std::string> Router::patterns() const {
    std::vector<std::string> out;
    out.reserve(routes_.size());
    for (const auto &entry : routes_) {
        out.push_back(entry.first);
    }
    return out;
}

Reply Router::dispatch(const httplib::Request &req) const {
    const Handler *handler = find(req.path, nullptr);
    if (handler == nullptr) {
        return not_found();
    }

    Reply reply;
    try {
        reply = (*handler)(req);
    } catch (const std::exception &e) {
        reply = internal_error(e.what());
    }

    if (reply.status == kStatusInternal) {
        LOG_WARN("[HTTP] " << req.method << " " << req.path << " failed: " << reply.error_text);
    }
    return reply;
}

//=============================================================================
// RouterBuilder
//=============================================================================

RouterBuilder::RouterBuilder(std::string account) : account_(std::move(account)) {}

std::string RouterBuilder::resolve(const std::string &pattern) const {
    std::string resolved = pattern;
    const std::string placeholder = kAccountPlaceholder;
    const auto pos = resolved.find(placeholder);
    if (pos != std::string::npos) {
        resolved.replace(pos, placeholder.size(), account_);
    }
    return resolved;
}

void RouterBuilder::add(const std::string &pattern, const Handler &handler) {
    const std::string path = resolve(pattern);
    router_.routes_[path] = handler;
    if (path.back() != '/') {
        router_.routes_[path + "/"] = handler;
    }
}

RouterBuilder &RouterBuilder::add_reply(const std::string &pattern, const Reply &reply) {
    add(pattern, [reply](const httplib::Request &) { return reply; });
    return *this;
}

RouterBuilder &RouterBuilder::add_resource(const std::string &pattern, Handler handler) {
    add(pattern, [handler = std::move(handler)](const httplib::Request &req) {
        if (req.path.size() > 1 && req.path.back() == '/') {
            return not_found();
        }
        return handler(req);
    });
    return *this;
}

Router RouterBuilder::build() {
    for (const auto &pattern : router_.patterns()) {
        LOG_DEBUG("[HTTP] Route registered: " << pattern);
    }
    return std::move(router_);
}

std::string raw_query(const httplib::Request &req) {
    const auto pos = req.target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    return req.target.substr(pos + 1);
}

}  // namespace http
}  // namespace cloudmock
