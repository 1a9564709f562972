#include <trello_mcp/trello/boards.hpp>

#include <trello_mcp/core/url.hpp>

#include "json_fields.hpp"

#include <algorithm>
#include <cctype>

namespace trello_mcp {

namespace {

const char* kMyBoardsPath = "members/me/boards";

std::string BoardPath(const ResourceId& id) {
    return "boards/" + UrlEncode(id.Value());
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ContainsFolded(const std::string& haystack, const std::string& folded_needle) {
    return ToLower(haystack).find(folded_needle) != std::string::npos;
}

Result<Board, Error> ParseBoardSummary(const nlohmann::json& record,
                                       const json_fields::Source& src) {
    auto id = json_fields::RequireString(record, "id", src);
    if (id.IsErr()) return Result<Board, Error>::Err(std::move(id).Error());
    auto name = json_fields::RequireString(record, "name", src);
    if (name.IsErr()) return Result<Board, Error>::Err(std::move(name).Error());
    auto url = json_fields::RequireString(record, "shortUrl", src);
    if (url.IsErr()) return Result<Board, Error>::Err(std::move(url).Error());

    Board board;
    board.id = std::move(id).Value();
    board.name = std::move(name).Value();
    board.url = std::move(url).Value();
    board.desc = json_fields::OptString(record, "desc");
    board.closed = false;
    return Result<Board, Error>::Ok(std::move(board));
}

Result<nlohmann::json, Error> FetchMyBoards(const TrelloClient& client,
                                            const json_fields::Source& src) {
    return client.Fetch(kMyBoardsPath).AndThen(
        [&src](nlohmann::json body) -> Result<nlohmann::json, Error> {
            auto shape = json_fields::RequireArray(body, src);
            if (shape.IsErr()) {
                return Result<nlohmann::json, Error>::Err(std::move(shape).Error());
            }
            return Result<nlohmann::json, Error>::Ok(std::move(body));
        });
}

} // namespace

Result<std::vector<Board>, Error> ListOpenBoards(
    const TrelloClient& client,
    std::size_t limit) {

    const json_fields::Source src{"ListOpenBoards", kMyBoardsPath};
    auto body = FetchMyBoards(client, src);
    if (body.IsErr()) {
        return Result<std::vector<Board>, Error>::Err(std::move(body).Error());
    }

    std::vector<Board> boards;
    for (const auto& record : body.Value()) {
        if (!record.is_object()) {
            return Result<std::vector<Board>, Error>::Err(
                json_fields::MakeMalformed(src, "Expected a JSON object record"));
        }
        if (json_fields::IsLiterallyTrue(record, "closed")) {
            continue;
        }
        auto board = ParseBoardSummary(record, src);
        if (board.IsErr()) {
            return Result<std::vector<Board>, Error>::Err(std::move(board).Error());
        }
        boards.push_back(std::move(board).Value());
    }
    if (boards.size() > limit) {
        boards.resize(limit);
    }
    return Result<std::vector<Board>, Error>::Ok(std::move(boards));
}

Result<std::vector<Board>, Error> SearchBoards(
    const TrelloClient& client,
    std::string_view query) {

    const json_fields::Source src{"SearchBoards", kMyBoardsPath};
    auto body = FetchMyBoards(client, src);
    if (body.IsErr()) {
        return Result<std::vector<Board>, Error>::Err(std::move(body).Error());
    }

    const auto needle = ToLower(query);
    std::vector<Board> matches;
    for (const auto& record : body.Value()) {
        if (!record.is_object()) {
            return Result<std::vector<Board>, Error>::Err(
                json_fields::MakeMalformed(src, "Expected a JSON object record"));
        }
        if (json_fields::IsLiterallyTrue(record, "closed")) {
            continue;
        }
        auto name = json_fields::RequireString(record, "name", src);
        if (name.IsErr()) {
            return Result<std::vector<Board>, Error>::Err(std::move(name).Error());
        }
        auto desc = json_fields::OptString(record, "desc");
        if (!ContainsFolded(name.Value(), needle) && !ContainsFolded(desc, needle)) {
            continue;
        }
        auto board = ParseBoardSummary(record, src);
        if (board.IsErr()) {
            return Result<std::vector<Board>, Error>::Err(std::move(board).Error());
        }
        matches.push_back(std::move(board).Value());
    }
    return Result<std::vector<Board>, Error>::Ok(std::move(matches));
}

Result<Board, Error> GetBoard(
    const TrelloClient& client,
    const ResourceId& board_id) {

    const auto path = BoardPath(board_id);
    const json_fields::Source src{"GetBoard", path};

    auto body = client.Fetch(path);
    if (body.IsErr()) {
        return Result<Board, Error>::Err(std::move(body).Error());
    }
    const auto& record = body.Value();
    auto shape = json_fields::RequireObject(record, src);
    if (shape.IsErr()) {
        return Result<Board, Error>::Err(std::move(shape).Error());
    }

    auto id = json_fields::RequireString(record, "id", src);
    if (id.IsErr()) return Result<Board, Error>::Err(std::move(id).Error());
    auto name = json_fields::RequireString(record, "name", src);
    if (name.IsErr()) return Result<Board, Error>::Err(std::move(name).Error());
    auto url = json_fields::RequireString(record, "url", src);
    if (url.IsErr()) return Result<Board, Error>::Err(std::move(url).Error());

    Board board;
    board.id = std::move(id).Value();
    board.name = std::move(name).Value();
    board.url = std::move(url).Value();
    board.desc = json_fields::OptString(record, "desc");
    board.closed = json_fields::IsLiterallyTrue(record, "closed");
    board.organization_id = json_fields::OptNullableString(record, "idOrganization");
    return Result<Board, Error>::Ok(std::move(board));
}

} // namespace trello_mcp
