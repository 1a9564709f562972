#include <trello_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace trello_mcp {

namespace {

constexpr size_t kMaxUpstreamMessage = 200;

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Length of the well-formed UTF-8 sequence starting at text[i], or 0.
size_t Utf8SequenceLength(const std::string& text, size_t i) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;  // overlong
        if (lead == 0xED) hi = 0x9F;  // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + len > text.size()) return 0;

    const auto second = static_cast<unsigned char>(text[i + 1]);
    if (second < lo || second > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) return 0;
    }
    return len;
}

// Copy at most max_bytes of text, never splitting a code point. Invalid
// bytes become U+FFFD.
std::string TruncateUtf8(const std::string& text, size_t max_bytes) {
    static const std::string kReplacement = "\xEF\xBF\xBD";
    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        const auto len = Utf8SequenceLength(text, i);
        const auto piece = len == 0 ? kReplacement : text.substr(i, len);
        if (out.size() + piece.size() > max_bytes) {
            out += "...";
            break;
        }
        out += piece;
        i += len == 0 ? 1 : len;
    }
    return out;
}

// Pull a short human-readable message out of an upstream error body.
// JSON bodies carry it under "message" (or "error"); plain-text bodies are
// the message themselves. HTML error pages from proxies are ignored.
std::optional<std::string> ExtractUpstreamMessage(const std::string& body) {
    auto text = Trim(body);
    if (text.empty()) return std::nullopt;

    if (text.front() == '{') {
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return std::nullopt;
        for (const char* key : {"message", "error"}) {
            auto it = j.find(key);
            if (it != j.end() && it->is_string() &&
                !it->get<std::string>().empty()) {
                return it->get<std::string>();
            }
        }
        return std::nullopt;
    }

    if (text.front() == '<') return std::nullopt;

    return TruncateUtf8(Trim(text.substr(0, text.find('\n'))), kMaxUpstreamMessage);
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto upstream = ExtractUpstreamMessage(response_body);

    std::string message;
    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
            message = "Unauthorized - check TRELLO_API_KEY and TRELLO_TOKEN";
            break;
        case 403:
            message = "Forbidden";
            break;
        case 404:
            message = "Not found";
            break;
        case 429:
            message = "Rate limited by upstream";
            break;
        case 500:
        case 502:
        case 503:
        case 504:
            message = "Upstream server error";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, upstream,
                 ErrorCategory::UpstreamHttp};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (upstream_message.has_value() && !upstream_message->empty()) {
        oss << " - upstream: " << *upstream_message;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["category"] = CategoryName();
    j["operation"] = operation;
    if (!endpoint.empty()) {
        j["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        j["http_status"] = *http_status;
    }
    j["message"] = message;
    if (upstream_message.has_value() && !upstream_message->empty()) {
        j["upstream_message"] = *upstream_message;
    }
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace trello_mcp
