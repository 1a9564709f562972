#include <trello_mcp/mcp/mcp_tool_handlers.hpp>

#include <trello_mcp/core/types.hpp>
#include <trello_mcp/trello/boards.hpp>
#include <trello_mcp/trello/cards.hpp>
#include <trello_mcp/trello/lists.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace trello_mcp {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolResult MakeOkResult(const nlohmann::json& data) {
    return ToolResult{
        false,
        nlohmann::json::array({{{"type", "text"}, {"text", data.dump()}}})};
}

// {"error": "<prefix>: <error text>", ...fallback}
ToolResult MakeEnvelope(const std::string& prefix, const Error& error,
                        nlohmann::json fallback = nlohmann::json::object()) {
    fallback["error"] = prefix + ": " + error.ToString();
    const auto text =
        fallback.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return ToolResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

Error InvalidArgument(const std::string& tool, const std::string& message) {
    return Error{tool, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

// A required string argument. Empty strings pass only when allow_empty.
Result<std::string, Error> RequireString(const nlohmann::json& params,
                                         const std::string& key,
                                         const std::string& tool,
                                         bool allow_empty = false) {
    if (!params.is_object() || !params.contains(key) || !params[key].is_string() ||
        (!allow_empty && params[key].get<std::string>().empty())) {
        return Result<std::string, Error>::Err(
            InvalidArgument(tool, "Missing required parameter: " + key));
    }
    return Result<std::string, Error>::Ok(params[key].get<std::string>());
}

// Get an optional string param with a default value.
std::string OptString(const nlohmann::json& params, const std::string& key,
                      const std::string& default_val = "") {
    if (params.is_object() && params.contains(key) && params[key].is_string()) {
        return params[key].get<std::string>();
    }
    return default_val;
}

// A required identifier argument, validated before it reaches a URL path.
Result<ResourceId, Error> RequireId(const nlohmann::json& params,
                                    const std::string& key,
                                    const std::string& tool) {
    auto raw = RequireString(params, key, tool);
    if (raw.IsErr()) {
        return Result<ResourceId, Error>::Err(std::move(raw).Error());
    }
    auto id = ResourceId::Create(raw.Value());
    if (id.IsErr()) {
        return Result<ResourceId, Error>::Err(
            InvalidArgument(tool, "Invalid " + key + ": " + id.Error()));
    }
    return Result<ResourceId, Error>::Ok(std::move(id).Value());
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Projections
// ---------------------------------------------------------------------------

nlohmann::json BoardSummaryJson(const Board& b) {
    return {{"id", b.id}, {"name", b.name}, {"url", b.url}};
}

nlohmann::json BoardSummariesJson(const std::vector<Board>& boards) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& b : boards) {
        j.push_back(BoardSummaryJson(b));
    }
    return j;
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// list_boards
ToolResult HandleListBoards(const TrelloClient& client,
                            const nlohmann::json& /*params*/) {
    auto result = ListOpenBoards(client);
    if (result.IsErr()) {
        return MakeEnvelope("Failed to fetch boards", result.Error(),
                            {{"boards", nlohmann::json::array()}});
    }
    return MakeOkResult(BoardSummariesJson(result.Value()));
}

// search_boards
ToolResult HandleSearchBoards(const TrelloClient& client,
                              const nlohmann::json& params) {
    const nlohmann::json fallback = {{"results", nlohmann::json::array()}};
    auto query = RequireString(params, "query", "search_boards", true);
    if (query.IsErr()) {
        return MakeEnvelope("Search failed", query.Error(), fallback);
    }

    auto result = SearchBoards(client, query.Value());
    if (result.IsErr()) {
        return MakeEnvelope("Search failed", result.Error(), fallback);
    }
    return MakeOkResult({{"results", BoardSummariesJson(result.Value())}});
}

// get_board_details
ToolResult HandleGetBoardDetails(const TrelloClient& client,
                                 const nlohmann::json& params) {
    auto board_id = RequireId(params, "boardId", "get_board_details");
    if (board_id.IsErr()) {
        return MakeEnvelope("Failed to fetch board", board_id.Error());
    }

    auto result = GetBoard(client, board_id.Value());
    if (result.IsErr()) {
        return MakeEnvelope("Failed to fetch board", result.Error());
    }

    const auto& b = result.Value();
    nlohmann::json j;
    j["id"] = b.id;
    j["name"] = b.name;
    j["desc"] = b.desc;
    j["url"] = b.url;
    j["closed"] = b.closed;
    if (b.organization_id.has_value()) {
        j["organization"] = *b.organization_id;
    } else {
        j["organization"] = nullptr;
    }
    return MakeOkResult(j);
}

// get_lists
ToolResult HandleGetLists(const TrelloClient& client,
                          const nlohmann::json& params) {
    auto board_id = RequireId(params, "boardId", "get_lists");
    if (board_id.IsErr()) {
        return MakeEnvelope("Failed to fetch lists", board_id.Error());
    }

    auto result = GetLists(client, board_id.Value());
    if (result.IsErr()) {
        return MakeEnvelope("Failed to fetch lists", result.Error());
    }

    nlohmann::json j = nlohmann::json::array();
    for (const auto& l : result.Value()) {
        j.push_back({{"id", l.id},
                     {"name", l.name},
                     {"closed", l.closed},
                     {"boardId", l.board_id}});
    }
    return MakeOkResult(j);
}

// get_cards
ToolResult HandleGetCards(const TrelloClient& client,
                          const nlohmann::json& params) {
    auto list_id = RequireId(params, "listId", "get_cards");
    if (list_id.IsErr()) {
        return MakeEnvelope("Failed to fetch cards", list_id.Error());
    }

    auto result = GetCards(client, list_id.Value());
    if (result.IsErr()) {
        return MakeEnvelope("Failed to fetch cards", result.Error());
    }

    nlohmann::json j = nlohmann::json::array();
    for (const auto& c : result.Value()) {
        j.push_back({{"id", c.id},
                     {"name", c.name},
                     {"desc", c.desc},
                     {"url", c.url},
                     {"closed", c.closed}});
    }
    return MakeOkResult(j);
}

// create_card
ToolResult HandleCreateCard(const TrelloClient& client,
                            const nlohmann::json& params) {
    auto list_id = RequireId(params, "listId", "create_card");
    if (list_id.IsErr()) {
        return MakeEnvelope("Failed to create card", list_id.Error());
    }
    auto name = RequireString(params, "name", "create_card");
    if (name.IsErr()) {
        return MakeEnvelope("Failed to create card", name.Error());
    }
    auto desc = OptString(params, "desc");

    auto result = CreateCard(client, list_id.Value(), name.Value(), desc);
    if (result.IsErr()) {
        return MakeEnvelope("Failed to create card", result.Error());
    }

    const auto& c = result.Value();
    return MakeOkResult({{"id", c.id},
                         {"name", c.name},
                         {"desc", c.desc},
                         {"url", c.url},
                         {"listId", c.list_id}});
}

} // namespace

void RegisterTrelloTools(ToolRegistry& registry, const TrelloClient& client) {
    // === Read-only tools ===

    registry.Register(
        "list_boards",
        "List the first 5 open Trello boards of the authenticated user. "
        "Returns id, name and short URL of each board.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        [&client](const nlohmann::json& params) {
            return HandleListBoards(client, params);
        });

    registry.Register(
        "search_boards",
        "Search open boards whose name or description contains the query "
        "(case-insensitive).",
        MakeSchema(
            {{"query", StringProp("Text to look for in board names and descriptions")}},
            {"query"}),
        [&client](const nlohmann::json& params) {
            return HandleSearchBoards(client, params);
        });

    registry.Register(
        "get_board_details",
        "Get details of one board: name, description, URL, closed state "
        "and organization.",
        MakeSchema(
            {{"boardId", StringProp("Board id or short link")}},
            {"boardId"}),
        [&client](const nlohmann::json& params) {
            return HandleGetBoardDetails(client, params);
        });

    registry.Register(
        "get_lists",
        "Get all lists of a board. Use the list ids with get_cards and "
        "create_card.",
        MakeSchema(
            {{"boardId", StringProp("Board id or short link")}},
            {"boardId"}),
        [&client](const nlohmann::json& params) {
            return HandleGetLists(client, params);
        });

    registry.Register(
        "get_cards",
        "Get all cards of a list.",
        MakeSchema(
            {{"listId", StringProp("List id (from get_lists)")}},
            {"listId"}),
        [&client](const nlohmann::json& params) {
            return HandleGetCards(client, params);
        });

    // === Write tools ===

    registry.Register(
        "create_card",
        "Create a new card at the end of a list. Not idempotent: every call "
        "adds a card.",
        MakeSchema(
            {{"listId", StringProp("List id (from get_lists)")},
             {"name", StringProp("Card title")},
             {"desc", StringProp("Card description (default: empty)")}},
            {"listId", "name"}),
        [&client](const nlohmann::json& params) {
            return HandleCreateCard(client, params);
        });
}

} // namespace trello_mcp
