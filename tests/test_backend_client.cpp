#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_gateway/backend/client.hpp"
#include "voice_gateway/backend/langgraph_backend.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/utils/cancellation.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace voice_gateway;
using nlohmann::json;
using voice_gateway::testing::eventually;

namespace {

// LangGraph look-alike on a loopback port.
class FakeLangGraphServer {
public:
    FakeLangGraphServer() {
        server_.Post("/threads", [this](const httplib::Request& req, httplib::Response& res) {
            const auto body = json::parse(req.body);
            const auto agent = body["metadata"].value("agent", "");
            if (agent == "down") {
                res.status = 503;
                return;
            }
            if (agent == "secret") {
                res.status = 403;
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                authorization_ = req.get_header_value("Authorization");
            }
            res.set_content(json{{"thread_id", "t-1"}}.dump(), "application/json");
        });
        server_.Get("/threads/t-1/state", [](const httplib::Request&, httplib::Response& res) {
            const json state = {
                {"values",
                 {{"messages", json::array({{{"role", "user"}, {"content", "earlier"}}})}}}};
            res.set_content(state.dump(), "application/json");
        });
        server_.Delete("/threads/t-1", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++deleted_;
            res.set_content("{}", "application/json");
        });
        server_.Post("/threads/t-1/runs/stream",
                     [this](const httplib::Request& req, httplib::Response& res) {
                         {
                             std::lock_guard<std::mutex> lock(mutex_);
                             run_body_ = json::parse(req.body);
                         }
                         res.set_content(
                             "event: metadata\ndata: {\"run_id\":\"r-1\"}\n\n"
                             "event: messages/partial\n"
                             "data: [{\"type\":\"ai\",\"id\":\"m1\",\"content\":\"Hello\"}]\n\n"
                             "event: messages/partial\n"
                             "data: [{\"type\":\"ai\",\"id\":\"m1\",\"content\":\"Hello there.\"}]\n\n"
                             "event: end\ndata: null\n\n",
                             "text/event-stream");
                     });
        server_.Post("/threads/t-err/runs/stream",
                     [](const httplib::Request&, httplib::Response& res) {
                         res.set_content("event: error\ndata: {\"message\":\"agent crashed\"}\n\n",
                                         "text/event-stream");
                     });
        server_.Post("/assistants/search", [](const httplib::Request&, httplib::Response& res) {
            const json found = json::array(
                {{{"assistant_id", "a-1"},
                  {"graph_id", "bank"},
                  {"metadata", {{"display_name", "Banking"}}}},
                 {{"assistant_id", "a-2"}, {"graph_id", "support"}},
                 "plain",
                 {{"metadata", json::object()}}});
            res.set_content(found.dump(), "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        eventually([this] { return server_.is_running(); });
    }

    ~FakeLangGraphServer() {
        server_.stop();
        thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    json run_body() {
        std::lock_guard<std::mutex> lock(mutex_);
        return run_body_;
    }

    std::string authorization() {
        std::lock_guard<std::mutex> lock(mutex_);
        return authorization_;
    }

    int deleted() {
        std::lock_guard<std::mutex> lock(mutex_);
        return deleted_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::mutex mutex_;
    json run_body_;
    std::string authorization_;
    int deleted_ = 0;
};

LangGraphBackend::Options backend_options(const std::string& url) {
    LangGraphBackend::Options options;
    options.base_url = url;
    options.authorization_token = "token-1";
    options.stream_mode = "messages";
    options.user_email = "caller@example.com";
    options.request.connect_timeout = std::chrono::milliseconds(1000);
    options.request.read_timeout = std::chrono::milliseconds(2000);
    options.request.write_timeout = std::chrono::milliseconds(2000);
    return options;
}

std::vector<std::string> drain(ReplyStream& stream) {
    utils::CancellationSource source;
    std::vector<std::string> deltas;
    while (auto delta = stream.next_increment(source.token(), std::chrono::milliseconds(2000))) {
        deltas.push_back(*delta);
    }
    return deltas;
}

}

TEST_CASE("failed statuses map to backend errors") {
    REQUIRE_THROWS_AS(throw_for_status(401, "", "GET /x"), BackendPermissionError);
    REQUIRE_THROWS_AS(throw_for_status(403, "", "GET /x"), BackendPermissionError);
    REQUIRE_THROWS_AS(throw_for_status(502, "", "GET /x"), BackendConnectionError);
    REQUIRE_THROWS_AS(throw_for_status(503, "", "GET /x"), BackendConnectionError);
    REQUIRE_THROWS_AS(throw_for_status(504, "", "GET /x"), BackendConnectionError);

    try {
        throw_for_status(422, "bad input", "POST /threads");
        FAIL("expected an exception");
    } catch (const BackendConnectionError&) {
        FAIL("422 is not a connection failure");
    } catch (const BackendError& ex) {
        REQUIRE(std::string(ex.what()) == "POST /threads failed with HTTP 422: bad input");
    }
}

TEST_CASE("threads are created and deleted on the server") {
    FakeLangGraphServer server;
    LangGraphBackend backend(backend_options(server.url()));

    REQUIRE(backend.create_thread("bank") == "t-1");
    REQUIRE(server.authorization() == "Bearer token-1");
    REQUIRE_THROWS_AS(backend.create_thread("down"), BackendConnectionError);
    REQUIRE_THROWS_AS(backend.create_thread("secret"), BackendPermissionError);

    backend.delete_thread("t-1");
    backend.delete_thread("");
    REQUIRE(server.deleted() == 1);
}

TEST_CASE("a run streams the reply and resends the history") {
    FakeLangGraphServer server;
    LangGraphBackend backend(backend_options(server.url()));

    auto stream = backend.start(ChatRequest{"t-1", "bank", "what is my balance", std::string("en-US")});
    REQUIRE(drain(*stream) == std::vector<std::string>{"Hello", " there."});

    const auto body = server.run_body();
    REQUIRE(body["assistant_id"] == "bank");
    REQUIRE(body["stream_mode"] == "messages");
    REQUIRE(body["config"]["configurable"]["language"] == "en-US");
    REQUIRE(body["config"]["configurable"]["user_email"] == "caller@example.com");
    REQUIRE(body["input"].size() == 2);
    REQUIRE(body["input"][0]["content"] == "earlier");
    REQUIRE(body["input"][1] == json{{"role", "user"}, {"content", "what is my balance"}});
}

TEST_CASE("history is not resent when disabled") {
    FakeLangGraphServer server;
    auto options = backend_options(server.url());
    options.send_history = false;
    LangGraphBackend backend(options);

    auto stream = backend.start(ChatRequest{"t-1", "bank", "hi", std::nullopt});
    drain(*stream);
    const auto body = server.run_body();
    REQUIRE(body["input"].size() == 1);
    REQUIRE_FALSE(body["config"]["configurable"].contains("language"));
}

TEST_CASE("an error event fails the reply stream") {
    FakeLangGraphServer server;
    LangGraphBackend backend(backend_options(server.url()));

    auto stream = backend.start(ChatRequest{"t-err", "bank", "hi", std::nullopt});
    REQUIRE_THROWS_AS(drain(*stream), BackendError);
}

TEST_CASE("an unreachable backend is a connection failure") {
    auto options = backend_options("http://127.0.0.1:1");
    options.request.connect_timeout = std::chrono::milliseconds(300);
    LangGraphBackend backend(options);

    REQUIRE_THROWS_AS(backend.create_thread("bank"), BackendConnectionError);
    auto stream = backend.start(ChatRequest{"", "bank", "hi", std::nullopt});
    REQUIRE_THROWS_AS(drain(*stream), BackendConnectionError);
}

TEST_CASE("assistants are normalized") {
    FakeLangGraphServer server;
    LangGraphBackend backend(backend_options(server.url()));

    const auto assistants = backend.list_assistants();
    REQUIRE(assistants.size() == 3);
    REQUIRE(assistants[0] == json{{"assistant_id", "a-1"}, {"graph_id", "bank"}, {"display_name", "Banking"}});
    REQUIRE(assistants[1]["display_name"] == "support");
    REQUIRE(assistants[2] == json{{"assistant_id", "plain"}, {"display_name", "plain"}});
}
