#pragma once

#include <string>

namespace cloudmock {
namespace http {

// Path split against a family's collection path ("/{account}/{family}")
struct ResourcePath {
    bool is_collection = false;
    std::string id;  // everything after "{collection}/", may contain '/'
};

inline ResourcePath parse_resource_path(const std::string &path, const std::string &collection) {
    ResourcePath out;
    if (path == collection) {
        out.is_collection = true;
        return out;
    }
    const std::string prefix = collection + "/";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        out.id = path.substr(prefix.size());
    } else {
        out.id = path;
    }
    return out;
}

inline bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline std::string trim_suffix(const std::string &s, const std::string &suffix) {
    return ends_with(s, suffix) ? s.substr(0, s.size() - suffix.size()) : s;
}

}  // namespace http
}  // namespace cloudmock
