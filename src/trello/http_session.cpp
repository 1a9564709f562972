#include <trello_mcp/trello/http_session.hpp>

#include <trello_mcp/core/log.hpp>
#include <trello_mcp/core/version.hpp>

#include <httplib.h>

#include <chrono>
#include <tuple>
#include <utility>

namespace trello_mcp {

namespace {

constexpr size_t kMaxBodyLog = 2000;
constexpr std::chrono::milliseconds kTimeoutSlack{100};

// httplib reports an expired read timeout and a connection dropped during
// the read alike as Error::Read. Only a read that waited out the read
// timeout counts as a timeout.
ErrorCategory CategoryFromHttpTransportError(httplib::Error error,
                                             std::chrono::steady_clock::duration elapsed,
                                             std::chrono::seconds read_timeout) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        case httplib::Error::Read:
            return elapsed + kTimeoutSlack >= read_timeout ? ErrorCategory::Timeout
                                                           : ErrorCategory::Transport;
        default:
            return ErrorCategory::Transport;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

// Split "https://api.trello.com/1" into {"https://api.trello.com", "/1"}.
std::pair<std::string, std::string> SplitBaseUrl(const std::string& base_url) {
    auto scheme_end = base_url.find("://");
    auto host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    auto path_start = base_url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {base_url, ""};
    }
    auto prefix = base_url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return {base_url.substr(0, path_start), prefix};
}

std::string Redacted(const std::string& target) {
    return RedactQuery(target, {"key", "token"});
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl - immutable after construction; safe to share across threads.
// ---------------------------------------------------------------------------
struct HttpSession::Impl {
    std::string scheme_host_port;
    std::string path_prefix;
    HttpSessionOptions options;
    httplib::Headers default_headers;

    Impl(const std::string& base_url, const HttpSessionOptions& opts)
        : options(opts) {
        std::tie(scheme_host_port, path_prefix) = SplitBaseUrl(base_url);
        default_headers.emplace("Accept", "application/json");
        default_headers.emplace("User-Agent", std::string("trello-mcp/") + kVersion);
    }

    std::unique_ptr<httplib::Client> MakeClient() const {
        auto client = std::make_unique<httplib::Client>(scheme_host_port);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_write_timeout(options.write_timeout);
        return client;
    }

    std::string Target(std::string_view path, const QueryParams& query) const {
        std::string target = path_prefix;
        if (path.empty() || path.front() != '/') {
            target += '/';
        }
        target += std::string(path);
        auto qs = BuildQueryString(query);
        if (!qs.empty()) {
            target += '?' + qs;
        }
        return target;
    }

    Result<HttpResponse, Error> Finish(const char* operation,
                                       std::string_view path,
                                       httplib::Result res,
                                       std::chrono::steady_clock::time_point started) const {
        if (!res) {
            const auto http_error = res.error();
            const auto elapsed = std::chrono::steady_clock::now() - started;
            return Result<HttpResponse, Error>::Err(Error{
                operation, std::string(path), std::nullopt,
                "HTTP request failed: " + httplib::to_string(http_error),
                std::nullopt,
                CategoryFromHttpTransportError(http_error, elapsed, options.read_timeout)});
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<HttpResponse, Error> DoGet(std::string_view path,
                                      const QueryParams& query) const {
        auto target = Target(path, query);
        LogInfo("http", "GET " + Redacted(target));
        auto client = MakeClient();
        const auto started = std::chrono::steady_clock::now();
        return Finish("Get", path, client->Get(target, default_headers), started);
    }

    Result<HttpResponse, Error> DoPost(std::string_view path,
                                       const QueryParams& query) const {
        auto target = Target(path, query);
        LogInfo("http", "POST " + Redacted(target));
        auto client = MakeClient();
        const auto started = std::chrono::steady_clock::now();
        return Finish("Post", path,
                      client->Post(target, default_headers, std::string(),
                                   "application/x-www-form-urlencoded"),
                      started);
    }
};

HttpSession::HttpSession(const std::string& base_url,
                         const HttpSessionOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

HttpSession::~HttpSession() = default;

Result<HttpResponse, Error> HttpSession::Get(std::string_view path,
                                             const QueryParams& query) {
    return impl_->DoGet(path, query);
}

Result<HttpResponse, Error> HttpSession::Post(std::string_view path,
                                              const QueryParams& query) {
    return impl_->DoPost(path, query);
}

} // namespace trello_mcp
