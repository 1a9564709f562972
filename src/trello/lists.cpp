#include <trello_mcp/trello/lists.hpp>

#include <trello_mcp/core/url.hpp>

#include "json_fields.hpp"

namespace trello_mcp {

namespace {

Result<BoardList, Error> ParseList(const nlohmann::json& record,
                                   const json_fields::Source& src) {
    auto id = json_fields::RequireString(record, "id", src);
    if (id.IsErr()) return Result<BoardList, Error>::Err(std::move(id).Error());
    auto name = json_fields::RequireString(record, "name", src);
    if (name.IsErr()) return Result<BoardList, Error>::Err(std::move(name).Error());
    auto board_id = json_fields::RequireString(record, "idBoard", src);
    if (board_id.IsErr()) return Result<BoardList, Error>::Err(std::move(board_id).Error());

    BoardList list;
    list.id = std::move(id).Value();
    list.name = std::move(name).Value();
    list.closed = json_fields::IsLiterallyTrue(record, "closed");
    list.board_id = std::move(board_id).Value();
    return Result<BoardList, Error>::Ok(std::move(list));
}

} // namespace

Result<std::vector<BoardList>, Error> GetLists(
    const TrelloClient& client,
    const ResourceId& board_id) {

    const auto path = "boards/" + UrlEncode(board_id.Value()) + "/lists";
    const json_fields::Source src{"GetLists", path};

    auto body = client.Fetch(path);
    if (body.IsErr()) {
        return Result<std::vector<BoardList>, Error>::Err(std::move(body).Error());
    }
    auto shape = json_fields::RequireArray(body.Value(), src);
    if (shape.IsErr()) {
        return Result<std::vector<BoardList>, Error>::Err(std::move(shape).Error());
    }

    std::vector<BoardList> lists;
    lists.reserve(body.Value().size());
    for (const auto& record : body.Value()) {
        auto list = ParseList(record, src);
        if (list.IsErr()) {
            return Result<std::vector<BoardList>, Error>::Err(std::move(list).Error());
        }
        lists.push_back(std::move(list).Value());
    }
    return Result<std::vector<BoardList>, Error>::Ok(std::move(lists));
}

} // namespace trello_mcp
