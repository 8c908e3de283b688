#include "query.hpp"

namespace cloudmock {
namespace http {

model::OptionalFilters parse_filters(const std::string &raw_query) {
    if (raw_query.empty()) {
        return std::nullopt;
    }

    model::Filters filters;
    std::size_t start = 0;
    while (start <= raw_query.size()) {
        std::size_t end = raw_query.find('&', start);
        if (end == std::string::npos) {
            end = raw_query.size();
        }

        const std::string pair = raw_query.substr(start, end - start);
        if (!pair.empty()) {
            const std::size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                filters[pair] = "";
            } else {
                filters[pair.substr(0, eq)] = pair.substr(eq + 1);
            }
        }
        start = end + 1;
    }
    return filters;
}

}  // namespace http
}  // namespace cloudmock
