#include <trello_mcp/mcp/mcp_http_server.hpp>

#include <trello_mcp/core/log.hpp>
#include <trello_mcp/core/version.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace trello_mcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

const char* Presence(bool set) {
    return set ? "Set" : "Missing";
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), kJsonContentType);
}

} // anonymous namespace

struct McpHttpServer::Impl {
    const McpServer& dispatcher;
    const ToolRegistry& registry;
    CredentialStatus credentials;
    httplib::Server server;
    std::string bound;

    Impl(const McpServer& d, const ToolRegistry& r, CredentialStatus c)
        : dispatcher(d), registry(r), credentials(c) {
        server.set_logger([](const httplib::Request& req,
                             const httplib::Response& res) {
            LogInfo("http", req.method + " " + req.path + " -> " +
                                std::to_string(res.status));
        });

        server.Post("/mcp", [this](const httplib::Request& req,
                                   httplib::Response& res) {
            HandlePost(req, res);
        });
        server.Get("/mcp", [](const httplib::Request&, httplib::Response& res) {
            SendJson(res, 200,
                     McpServer::MakeResult(nullptr, McpServer::InitializeResult()));
        });
        server.Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
            auto names = registry.Names();
            SendJson(res, 200, {{"tools", names},
                                {"count", names.size()},
                                {"description", "Trello tools served over MCP"}});
        });
        server.Get("/", [](const httplib::Request&, httplib::Response& res) {
            SendJson(res, 200, {{"message", "Trello MCP server"},
                                {"version", kVersion},
                                {"endpoints", {
                                    {"mcp", "POST /mcp (JSON-RPC), GET /mcp (discovery)"},
                                    {"tools", "GET /tools"},
                                    {"health", "GET /health"}}}});
        });
        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            SendJson(res, 200, {{"status", "OK"},
                                {"trello", {
                                    {"apiKey", Presence(credentials.api_key_set)},
                                    {"token", Presence(credentials.token_set)}}}});
        });
    }

    void HandlePost(const httplib::Request& req, httplib::Response& res) const {
        auto message = nlohmann::json::parse(req.body, nullptr, false);
        if (message.is_discarded()) {
            SendJson(res, 400, McpServer::MakeError(nullptr, -32700, "Parse error"));
            return;
        }
        auto response = dispatcher.HandleMessage(message);
        if (!response) {
            res.status = 202;
            return;
        }
        SendJson(res, 200, *response);
    }
};

McpHttpServer::McpHttpServer(const McpServer& dispatcher,
                             const ToolRegistry& registry,
                             CredentialStatus credentials)
    : impl_(std::make_unique<Impl>(dispatcher, registry, credentials)) {}

McpHttpServer::~McpHttpServer() = default;

Result<int, Error> McpHttpServer::Bind(const std::string& host, int port) {
    int bound_port = port;
    if (port == 0) {
        bound_port = impl_->server.bind_to_any_port(host);
    } else if (!impl_->server.bind_to_port(host, port)) {
        bound_port = -1;
    }
    if (bound_port <= 0) {
        return Result<int, Error>::Err(Error{
            "Bind", host + ":" + std::to_string(port), std::nullopt,
            "Cannot bind HTTP listener", std::nullopt, ErrorCategory::Transport});
    }
    impl_->bound = host + ":" + std::to_string(bound_port);
    return Result<int, Error>::Ok(bound_port);
}

Result<void, Error> McpHttpServer::Listen() {
    LogInfo("http", "listening on http://" + impl_->bound + "/mcp");
    if (!impl_->server.listen_after_bind()) {
        return Result<void, Error>::Err(Error{
            "Listen", impl_->bound, std::nullopt,
            "HTTP listener stopped with an error", std::nullopt,
            ErrorCategory::Transport});
    }
    return Result<void, Error>::Ok();
}

void McpHttpServer::WaitUntilReady() const {
    impl_->server.wait_until_ready();
}

void McpHttpServer::Stop() {
    impl_->server.stop();
}

} // namespace trello_mcp
