#include <trello_mcp/trello/trello_client.hpp>

#include <trello_mcp/core/log.hpp>

#include <utility>

namespace trello_mcp {

namespace {

bool IsSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

Result<nlohmann::json, Error> InterpretResponse(
    const std::string& operation,
    std::string_view endpoint,
    Result<HttpResponse, Error> response) {
    if (response.IsErr()) {
        LogWarn("trello", response.Error().ToString());
        return Result<nlohmann::json, Error>::Err(std::move(response).Error());
    }

    const auto& http = response.Value();
    if (!IsSuccessStatus(http.status_code)) {
        auto error = Error::FromHttpStatus(operation, std::string(endpoint),
                                           http.status_code, http.body);
        LogWarn("trello", error.ToString());
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }

    auto parsed = nlohmann::json::parse(http.body, nullptr, false);
    if (parsed.is_discarded()) {
        return Result<nlohmann::json, Error>::Err(Error::Malformed(
            operation, std::string(endpoint), "Response body is not valid JSON"));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(parsed));
}

} // anonymous namespace

TrelloClient::TrelloClient(IHttpSession& session, TrelloCredentials credentials)
    : session_(session), credentials_(std::move(credentials)) {}

QueryParams TrelloClient::WithCredentials(const QueryParams& params) const {
    QueryParams merged = params;
    merged["key"] = credentials_.api_key;
    merged["token"] = credentials_.token;
    return merged;
}

Result<nlohmann::json, Error> TrelloClient::Fetch(
    std::string_view endpoint,
    const QueryParams& params) const {
    LogDebug("trello", "fetch " + std::string(endpoint));
    return InterpretResponse("Fetch", endpoint,
                             session_.Get(endpoint, WithCredentials(params)));
}

Result<nlohmann::json, Error> TrelloClient::Create(
    std::string_view endpoint,
    const QueryParams& params) const {
    LogDebug("trello", "create " + std::string(endpoint));
    return InterpretResponse("Create", endpoint,
                             session_.Post(endpoint, WithCredentials(params)));
}

} // namespace trello_mcp
