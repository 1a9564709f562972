#include <catch2/catch_test_macros.hpp>

#include <trello_mcp/trello/http_session.hpp>

#include <httplib.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace trello_mcp;

// ===========================================================================
// Helper: spin up a local httplib::Server for tests that exercise the real
// HttpSession against a socket.
// ===========================================================================
namespace {

// A tiny RAII wrapper that starts an httplib::Server on a background thread
// and stops it on destruction.
class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        // Let the OS pick a free port by binding to 0.
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] int Port() const noexcept { return port_; }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

std::string BaseUrl(int port) {
    return "http://127.0.0.1:" + std::to_string(port) + "/1";
}

HttpSessionOptions ShortTimeouts() {
    HttpSessionOptions opts;
    opts.connect_timeout = std::chrono::seconds{2};
    opts.read_timeout = std::chrono::seconds{1};
    opts.write_timeout = std::chrono::seconds{1};
    return opts;
}

} // anonymous namespace

TEST_CASE("HttpSession: GET appends path to base prefix and sends query", "[http][session]") {
    httplib::Server svr;
    std::string seen_path;
    std::string seen_key;
    std::string seen_token;
    std::string seen_accept;
    std::string seen_agent;
    svr.Get("/1/members/me/boards", [&](const httplib::Request& req, httplib::Response& res) {
        seen_path = req.path;
        seen_key = req.get_param_value("key");
        seen_token = req.get_param_value("token");
        seen_accept = req.get_header_value("Accept");
        seen_agent = req.get_header_value("User-Agent");
        res.set_content("[]", "application/json");
    });
    LocalServer server(svr);

    HttpSession session(BaseUrl(server.Port()), ShortTimeouts());
    auto result = session.Get("members/me/boards", {{"key", "k1"}, {"token", "t1"}});

    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(result.Value().body == "[]");
    CHECK(seen_path == "/1/members/me/boards");
    CHECK(seen_key == "k1");
    CHECK(seen_token == "t1");
    CHECK(seen_accept == "application/json");
    CHECK(seen_agent.rfind("trello-mcp/", 0) == 0);
}

TEST_CASE("HttpSession: non-2xx status is Ok at the transport level", "[http][session]") {
    httplib::Server svr;
    svr.Get("/1/boards/nope", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content("The requested resource was not found.", "text/plain");
    });
    LocalServer server(svr);

    HttpSession session(BaseUrl(server.Port()), ShortTimeouts());
    auto result = session.Get("boards/nope", {});

    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 404);
    CHECK(result.Value().body == "The requested resource was not found.");
}

TEST_CASE("HttpSession: POST carries fields as encoded query parameters", "[http][session]") {
    httplib::Server svr;
    std::string seen_name;
    std::string seen_desc;
    std::string seen_body = "unset";
    bool saw_desc = false;
    svr.Post("/1/cards", [&](const httplib::Request& req, httplib::Response& res) {
        seen_name = req.get_param_value("name");
        saw_desc = req.has_param("desc");
        seen_desc = req.get_param_value("desc");
        seen_body = req.body;
        res.set_content(R"({"id":"c1"})", "application/json");
    });
    LocalServer server(svr);

    HttpSession session(BaseUrl(server.Port()), ShortTimeouts());
    auto result = session.Post("cards", {{"idList", "l1"}, {"name", "Buy milk & eggs"}, {"desc", ""}});

    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(seen_name == "Buy milk & eggs");
    CHECK(saw_desc);
    CHECK(seen_desc.empty());
    CHECK(seen_body.empty());
}

TEST_CASE("HttpSession: response headers are returned", "[http][session]") {
    httplib::Server svr;
    svr.Get("/1/x", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("X-Request-Id", "abc");
        res.set_content("{}", "application/json");
    });
    LocalServer server(svr);

    HttpSession session(BaseUrl(server.Port()), ShortTimeouts());
    auto result = session.Get("x", {});
    REQUIRE(result.IsOk());
    CHECK(result.Value().headers.at("X-Request-Id") == "abc");
}

TEST_CASE("HttpSession: refused connection is a Transport error", "[http][session]") {
    int closed_port = 0;
    {
        httplib::Server svr;
        LocalServer server(svr);
        closed_port = server.Port();
    }

    HttpSession session(BaseUrl(closed_port), ShortTimeouts());
    auto result = session.Get("members/me/boards", {});

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
    CHECK(result.Error().operation == "Get");
    CHECK_FALSE(result.Error().http_status.has_value());
}

TEST_CASE("HttpSession: slow upstream is a Timeout error", "[http][session]") {
    httplib::Server svr;
    svr.Get("/1/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        res.set_content("[]", "application/json");
    });
    LocalServer server(svr);

    HttpSession session(BaseUrl(server.Port()), ShortTimeouts());
    auto result = session.Get("slow", {});

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("HttpSession: connection dropped mid-body is a Transport error", "[http][session]") {
    httplib::Server svr;
    svr.Get("/1/truncated", [](const httplib::Request&, httplib::Response& res) {
        res.set_content_provider(
            100, "application/json",
            [](size_t, size_t, httplib::DataSink& sink) {
                sink.write("[{\"id\":", 7);
                return false;
            });
    });
    LocalServer server(svr);

    HttpSession session(BaseUrl(server.Port()), ShortTimeouts());
    auto result = session.Get("truncated", {});

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
}
