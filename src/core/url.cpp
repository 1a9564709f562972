#include <trello_mcp/core/url.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace trello_mcp {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string BuildQueryString(const QueryParams& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += '&';
        out += UrlEncode(key);
        out += '=';
        out += UrlEncode(value);
    }
    return out;
}

std::string RedactQuery(std::string_view path_and_query,
                        std::initializer_list<std::string_view> keys) {
    const auto qpos = path_and_query.find('?');
    if (qpos == std::string_view::npos) {
        return std::string(path_and_query);
    }

    std::string out(path_and_query.substr(0, qpos + 1));
    auto query = path_and_query.substr(qpos + 1);
    bool first = true;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{}
                                                : query.substr(amp + 1);

        if (!first) out += '&';
        first = false;

        auto eq = pair.find('=');
        auto name = pair.substr(0, eq);
        const bool secret = std::find(keys.begin(), keys.end(), name) != keys.end();
        if (secret && eq != std::string_view::npos) {
            out += std::string(name) + "=<redacted>";
        } else {
            out += std::string(pair);
        }
    }
    return out;
}

} // namespace trello_mcp
