#pragma once

#include <trello_mcp/core/result.hpp>
#include <trello_mcp/core/url.hpp>
#include <trello_mcp/trello/i_http_session.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace trello_mcp {

constexpr const char* kTrelloBaseUrl = "https://api.trello.com/1";

// ---------------------------------------------------------------------------
// TrelloCredentials - static API key and access token. Both must be
// non-empty; the config loader refuses to start otherwise.
// ---------------------------------------------------------------------------
struct TrelloCredentials {
    std::string api_key;
    std::string token;
};

// ---------------------------------------------------------------------------
// TrelloClient - authenticated calls against the Trello REST API.
//
// Every request carries "key" and "token" as query parameters, merged over
// the caller's parameters. A single attempt is made per call.
//
// Failure mapping:
//   - transport failure       -> Transport / Timeout (from the session)
//   - non-2xx status          -> UpstreamHttp with http_status set
//   - body is not valid JSON  -> MalformedResponse
//
// Holds only read-only state; one instance serves concurrent callers.
// ---------------------------------------------------------------------------
class TrelloClient {
public:
    TrelloClient(IHttpSession& session, TrelloCredentials credentials);

    /// GET {base}/{endpoint}. Returns the parsed body (object or array).
    [[nodiscard]] Result<nlohmann::json, Error> Fetch(
        std::string_view endpoint,
        const QueryParams& params = {}) const;

    /// POST {base}/{endpoint}. Write fields travel as query parameters,
    /// the request body is empty.
    [[nodiscard]] Result<nlohmann::json, Error> Create(
        std::string_view endpoint,
        const QueryParams& params) const;

private:
    [[nodiscard]] QueryParams WithCredentials(const QueryParams& params) const;

    IHttpSession& session_;
    TrelloCredentials credentials_;
};

} // namespace trello_mcp
