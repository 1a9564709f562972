#pragma once

#include <trello_mcp/mcp/tool_registry.hpp>
#include <trello_mcp/trello/trello_client.hpp>

namespace trello_mcp {

// Register the six Trello tools with the MCP tool registry:
//   list_boards, search_boards, get_board_details, get_lists, get_cards,
//   create_card
//
// Each handler captures &client by reference; the client must outlive the
// registry. Handlers never fail: any error becomes an {"error": ...}
// envelope with is_error set.
void RegisterTrelloTools(ToolRegistry& registry, const TrelloClient& client);

} // namespace trello_mcp
