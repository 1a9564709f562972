#include <trello_mcp/trello/cards.hpp>

#include <trello_mcp/core/log.hpp>
#include <trello_mcp/core/url.hpp>

#include "json_fields.hpp"

namespace trello_mcp {

namespace {

const char* kCardsPath = "cards";

Result<Card, Error> ParseCard(const nlohmann::json& record,
                              const json_fields::Source& src) {
    auto id = json_fields::RequireString(record, "id", src);
    if (id.IsErr()) return Result<Card, Error>::Err(std::move(id).Error());
    auto name = json_fields::RequireString(record, "name", src);
    if (name.IsErr()) return Result<Card, Error>::Err(std::move(name).Error());
    auto url = json_fields::RequireString(record, "shortUrl", src);
    if (url.IsErr()) return Result<Card, Error>::Err(std::move(url).Error());

    Card card;
    card.id = std::move(id).Value();
    card.name = std::move(name).Value();
    card.desc = json_fields::OptString(record, "desc");
    card.url = std::move(url).Value();
    card.closed = json_fields::IsLiterallyTrue(record, "closed");
    return Result<Card, Error>::Ok(std::move(card));
}

} // namespace

Result<std::vector<Card>, Error> GetCards(
    const TrelloClient& client,
    const ResourceId& list_id) {

    const auto path = "lists/" + UrlEncode(list_id.Value()) + "/cards";
    const json_fields::Source src{"GetCards", path};

    auto body = client.Fetch(path);
    if (body.IsErr()) {
        return Result<std::vector<Card>, Error>::Err(std::move(body).Error());
    }
    auto shape = json_fields::RequireArray(body.Value(), src);
    if (shape.IsErr()) {
        return Result<std::vector<Card>, Error>::Err(std::move(shape).Error());
    }

    std::vector<Card> cards;
    cards.reserve(body.Value().size());
    for (const auto& record : body.Value()) {
        auto card = ParseCard(record, src);
        if (card.IsErr()) {
            return Result<std::vector<Card>, Error>::Err(std::move(card).Error());
        }
        cards.push_back(std::move(card).Value());
    }
    return Result<std::vector<Card>, Error>::Ok(std::move(cards));
}

Result<CreatedCard, Error> CreateCard(
    const TrelloClient& client,
    const ResourceId& list_id,
    const std::string& name,
    const std::string& desc) {

    const json_fields::Source src{"CreateCard", kCardsPath};
    QueryParams params = {
        {"idList", list_id.Value()},
        {"name", name},
        {"desc", desc},
    };

    auto body = client.Create(kCardsPath, params);
    if (body.IsErr()) {
        return Result<CreatedCard, Error>::Err(std::move(body).Error());
    }
    const auto& record = body.Value();
    auto shape = json_fields::RequireObject(record, src);
    if (shape.IsErr()) {
        return Result<CreatedCard, Error>::Err(std::move(shape).Error());
    }

    auto id = json_fields::RequireString(record, "id", src);
    if (id.IsErr()) return Result<CreatedCard, Error>::Err(std::move(id).Error());
    auto card_name = json_fields::RequireString(record, "name", src);
    if (card_name.IsErr()) return Result<CreatedCard, Error>::Err(std::move(card_name).Error());
    auto url = json_fields::RequireString(record, "shortUrl", src);
    if (url.IsErr()) return Result<CreatedCard, Error>::Err(std::move(url).Error());
    auto card_list = json_fields::RequireString(record, "idList", src);
    if (card_list.IsErr()) return Result<CreatedCard, Error>::Err(std::move(card_list).Error());

    CreatedCard card;
    card.id = std::move(id).Value();
    card.name = std::move(card_name).Value();
    card.desc = json_fields::OptString(record, "desc");
    card.url = std::move(url).Value();
    card.list_id = std::move(card_list).Value();
    LogInfo("trello", "created card " + card.id + " in list " + card.list_id);
    return Result<CreatedCard, Error>::Ok(std::move(card));
}

} // namespace trello_mcp
