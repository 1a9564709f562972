#pragma once

#include <trello_mcp/core/result.hpp>
#include <trello_mcp/core/types.hpp>
#include <trello_mcp/trello/trello_client.hpp>

#include <string>
#include <vector>

namespace trello_mcp {

struct BoardList {
    std::string id;
    std::string name;
    bool closed = false;
    std::string board_id;
};

// GET /boards/{id}/lists - lists of one board, in upstream order. Read-only;
// repeated calls against an unchanged board return the same result.
[[nodiscard]] Result<std::vector<BoardList>, Error> GetLists(
    const TrelloClient& client,
    const ResourceId& board_id);

} // namespace trello_mcp
