#pragma once

#include <string>

#include "model/resources.hpp"

namespace cloudmock {
namespace http {

/**
 * @brief Parse a raw query string into list filters
 *
 * Pairs are split on '&' and then on the first '='. No URL decoding is done.
 * A repeated key keeps its last value; a pair without '=' maps to "".
 *
 * @return std::nullopt when raw_query is empty, otherwise the filter map
 */
model::OptionalFilters parse_filters(const std::string &raw_query);

}  // namespace http
}  // namespace cloudmock
