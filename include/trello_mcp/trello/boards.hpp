#pragma once

#include <trello_mcp/core/result.hpp>
#include <trello_mcp/core/types.hpp>
#include <trello_mcp/trello/trello_client.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trello_mcp {

// ---------------------------------------------------------------------------
// Board - projection of a Trello board.
//
// Summaries (ListOpenBoards, SearchBoards) carry the board's short link in
// url and never set organization_id. GetBoard carries the full board url.
// ---------------------------------------------------------------------------
struct Board {
    std::string id;
    std::string name;
    std::string url;
    std::string desc;
    bool closed = false;
    std::optional<std::string> organization_id;
};

constexpr std::size_t kListBoardsLimit = 5;

// ---------------------------------------------------------------------------
// Boards - free functions over the caller's boards.
//
// GET /members/me/boards    - every board visible to the token holder
// GET /boards/{id}          - one board
// ---------------------------------------------------------------------------

/// The first `limit` open boards, in upstream order. A board is closed only
/// when its "closed" field is the JSON literal true.
[[nodiscard]] Result<std::vector<Board>, Error> ListOpenBoards(
    const TrelloClient& client,
    std::size_t limit = kListBoardsLimit);

/// Open boards whose name or description contains `query`, compared
/// case-insensitively. An empty query matches every open board.
[[nodiscard]] Result<std::vector<Board>, Error> SearchBoards(
    const TrelloClient& client,
    std::string_view query);

[[nodiscard]] Result<Board, Error> GetBoard(
    const TrelloClient& client,
    const ResourceId& board_id);

} // namespace trello_mcp
