#pragma once

#include <trello_mcp/core/result.hpp>
#include <trello_mcp/core/types.hpp>
#include <trello_mcp/trello/trello_client.hpp>

#include <string>
#include <vector>

namespace trello_mcp {

// ---------------------------------------------------------------------------
// Card - projection of a Trello card. url is the card's short link.
// ---------------------------------------------------------------------------
struct Card {
    std::string id;
    std::string name;
    std::string desc;
    std::string url;
    bool closed = false;
};

// A card as echoed back by the upstream after creation.
struct CreatedCard {
    std::string id;
    std::string name;
    std::string desc;
    std::string url;
    std::string list_id;
};

// ---------------------------------------------------------------------------
// Cards - free functions for card operations.
//
// GET  /lists/{id}/cards   - cards of one list, upstream order
// POST /cards              - create a card (idList, name, desc as query)
//
// CreateCard is not idempotent: each successful call adds a new card.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<std::vector<Card>, Error> GetCards(
    const TrelloClient& client,
    const ResourceId& list_id);

[[nodiscard]] Result<CreatedCard, Error> CreateCard(
    const TrelloClient& client,
    const ResourceId& list_id,
    const std::string& name,
    const std::string& desc = "");

} // namespace trello_mcp
