#pragma once

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>

namespace trello_mcp {

// Query parameters, kept sorted so request URLs are deterministic.
using QueryParams = std::map<std::string, std::string>;

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// "a=1&b=x%20y" from {{"a","1"},{"b","x y"}}. Empty map gives "".
std::string BuildQueryString(const QueryParams& params);

// Replace the values of the named parameters in a path-with-query with
// "<redacted>", for logging. Other parameters and the path are untouched.
std::string RedactQuery(std::string_view path_and_query,
                        std::initializer_list<std::string_view> keys);

} // namespace trello_mcp
