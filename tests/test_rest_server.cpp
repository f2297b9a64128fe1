#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_gateway/config.hpp"
#include "voice_gateway/server/rest_server.hpp"
#include "voice_gateway/session/session_manager.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using namespace voice_gateway;
using nlohmann::json;
using voice_gateway::testing::FakeServices;
using voice_gateway::testing::FakeTransport;

namespace {

SessionManager::Options manager_options() {
    SessionManager::Options options;
    options.reap_interval = std::chrono::milliseconds(20);
    options.teardown_grace = std::chrono::milliseconds(500);
    options.default_agent = "bank";
    return options;
}

Config rest_config() {
    Config config;
    config.default_agent = "bank";
    config.sip_stun_servers.clear();
    return config;
}

}

TEST_CASE("assistants come from the backend filtered by the allow-list") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    auto config = rest_config();
    config.allowed_agents = {"bank", "support"};

    RestServer server(config, sessions, [] {
        return json::array({{{"assistant_id", "bank"}, {"display_name", "Banking"}},
                            {{"assistant_id", "pirate"}, {"display_name", "Pirate"}}});
    });
    const auto response = server.handle_assistants();
    REQUIRE(response.status == 200);
    REQUIRE(response.body["default"] == "bank");
    REQUIRE(response.body["assistants"].size() == 1);
    REQUIRE(response.body["assistants"][0]["display_name"] == "Banking");
}

TEST_CASE("assistants fall back to the configured agents") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    auto config = rest_config();
    config.allowed_agents = {"bank", "support"};

    RestServer failing(config, sessions, []() -> json {
        throw BackendError("backend down");
    });
    const auto listed = failing.handle_assistants().body["assistants"];
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[1]["assistant_id"] == "support");

    config.allowed_agents.clear();
    RestServer empty(config, sessions, [] { return json::array(); });
    const auto fallback = empty.handle_assistants().body["assistants"];
    REQUIRE(fallback.size() == 1);
    REQUIRE(fallback[0]["assistant_id"] == "bank");
}

TEST_CASE("ice servers include stun and turn entries") {
    auto config = rest_config();
    auto servers = build_ice_servers(config);
    REQUIRE(servers.size() == 1);
    REQUIRE(servers[0]["urls"] == "stun:stun.l.google.com:19302");

    config.sip_stun_servers = {"stun.example.com:3478", "stun:other.example.com"};
    config.turn_server_url = "turn:relay.example.com:3478";
    config.turn_username = "caller";
    config.turn_password = "secret";
    servers = build_ice_servers(config);
    REQUIRE(servers.size() == 3);
    REQUIRE(servers[0]["urls"] == "stun:stun.example.com:3478");
    REQUIRE(servers[1]["urls"] == "stun:other.example.com");
    REQUIRE(servers[2] == json{{"urls", "turn:relay.example.com:3478"},
                               {"username", "caller"},
                               {"credential", "secret"}});
}

TEST_CASE("sessions can be listed, read and closed") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    const auto config = rest_config();
    RestServer server(config, sessions, nullptr);

    auto call = std::make_shared<FakeTransport>("call-9");
    const auto info = sessions.create_session(call, SessionConfig{"en-US", ""});

    const auto listed = server.handle_list_sessions();
    REQUIRE(listed.status == 200);
    REQUIRE(listed.body["sessions"].size() == 1);

    const auto found = server.handle_get_session(info.id);
    REQUIRE(found.status == 200);
    REQUIRE(found.body["id"] == info.id);
    REQUIRE(found.body["transport_id"] == "call-9");
    REQUIRE(found.body["language"] == "en-US");
    REQUIRE(found.body["agent"] == "bank");
    REQUIRE(found.body["state"] == "ACTIVE");
    REQUIRE(found.body["turn_state"] == "IDLE");

    REQUIRE(server.handle_get_session("unknown").status == 404);

    const auto closed = server.handle_delete_session(info.id);
    REQUIRE(closed.status == 200);
    REQUIRE(closed.body["closed"] == true);
    REQUIRE(call->closed());

    const auto again = server.handle_delete_session(info.id);
    REQUIRE(again.status == 200);
    REQUIRE(again.body["closed"] == false);
}

TEST_CASE("transcript events are paged by sequence") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    const auto config = rest_config();
    RestServer server(config, sessions, nullptr);
    const auto info =
        sessions.create_session(std::make_shared<FakeTransport>("call-1"), SessionConfig{});

    const auto page = server.handle_session_events(info.id, "");
    REQUIRE(page.status == 200);
    REQUIRE(page.body["session_id"] == info.id);
    REQUIRE(page.body["events"].empty());

    REQUIRE(server.handle_session_events(info.id, "5").status == 200);
    REQUIRE(server.handle_session_events(info.id, "abc").status == 400);
    REQUIRE(server.handle_session_events(info.id, "-1").status == 400);
    REQUIRE(server.handle_session_events(info.id, "99999999999999999999999").status == 400);
    REQUIRE(server.handle_session_events("unknown", "0").status == 404);
}
