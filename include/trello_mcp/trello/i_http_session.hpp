#pragma once

#include <trello_mcp/core/result.hpp>
#include <trello_mcp/core/url.hpp>

#include <map>
#include <string>
#include <string_view>

namespace trello_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders - response headers as key-value pairs.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse - the result of an HTTP request that reached the server.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpSession - abstract HTTP transport for the upstream API.
//
// Paths are relative to the session's base URL ("members/me/boards").
// Query parameters are sent URL-encoded; POSTs carry an empty body.
//
// Only transport failures (DNS, connect, TLS, timeout) are errors. Any HTTP
// status, 2xx or not, is returned as an Ok HttpResponse; interpreting the
// status is the caller's job. This enables offline testing via
// MockHttpSession.
//
// Implementations must be safe to call from several threads at once.
// ---------------------------------------------------------------------------
class IHttpSession {
public:
    virtual ~IHttpSession() = default;

    // Non-copyable, non-movable (polymorphic base).
    IHttpSession(const IHttpSession&) = delete;
    IHttpSession& operator=(const IHttpSession&) = delete;
    IHttpSession(IHttpSession&&) = delete;
    IHttpSession& operator=(IHttpSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const QueryParams& query) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        const QueryParams& query) = 0;

protected:
    IHttpSession() = default;
};

} // namespace trello_mcp
