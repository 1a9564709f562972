#pragma once

#include <trello_mcp/trello/i_http_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace trello_mcp {

// ---------------------------------------------------------------------------
// HttpSessionOptions - timeouts for one upstream call.
// ---------------------------------------------------------------------------
struct HttpSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{10};
    std::chrono::seconds write_timeout{10};
};

// ---------------------------------------------------------------------------
// HttpSession - concrete IHttpSession implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header.
//
//   - base_url may carry a path prefix ("https://api.trello.com/1"); request
//     paths are appended to it
//   - every request uses its own httplib::Client, so concurrent callers
//     never share a connection
//   - single attempt per request, no retries
//   - "key" and "token" query values are redacted from logs
// ---------------------------------------------------------------------------
class HttpSession : public IHttpSession {
public:
    explicit HttpSession(const std::string& base_url,
                         const HttpSessionOptions& options = {});

    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) = delete;
    HttpSession& operator=(HttpSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const QueryParams& query) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        const QueryParams& query) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace trello_mcp
