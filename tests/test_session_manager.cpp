#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/session/session_manager.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

using namespace voice_gateway;
using voice_gateway::testing::FakeServices;
using voice_gateway::testing::FakeTransport;
using voice_gateway::testing::eventually;
using voice_gateway::testing::make_frame;

namespace {

SessionManager::Options manager_options() {
    SessionManager::Options options;
    options.max_sessions = 4;
    options.idle_timeout = std::chrono::milliseconds(60000);
    options.reap_interval = std::chrono::milliseconds(20);
    options.teardown_grace = std::chrono::milliseconds(500);
    options.default_agent = "bank";
    return options;
}

std::shared_ptr<FakeTransport> transport(const std::string& id) {
    return std::make_shared<FakeTransport>(id);
}

}

TEST_CASE("a session is created and can be looked up") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());

    const auto info = sessions.create_session(transport("call-1"), SessionConfig{"multi", ""});
    REQUIRE(info.id.size() == 32);
    REQUIRE(std::all_of(info.id.begin(), info.id.end(),
                        [](unsigned char ch) { return std::isxdigit(ch) != 0; }));
    REQUIRE(info.state == SessionState::Active);
    REQUIRE(info.config.language == "auto");
    REQUIRE(info.config.agent == "bank");

    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions.find_session(info.id)->transport_id == "call-1");
    REQUIRE(sessions.session_for_transport("call-1") == std::optional<std::string>(info.id));
    REQUIRE(sessions.list_sessions().size() == 1);
    REQUIRE(sessions.transcript_events(info.id, 0)->empty());
    REQUIRE(sessions.route_inbound_frame(info.id, make_frame(1)));

    REQUIRE_FALSE(sessions.find_session("missing"));
    REQUIRE_FALSE(sessions.transcript_events("missing", 0));
    REQUIRE_FALSE(sessions.route_inbound_frame("missing", make_frame(2)));
}

TEST_CASE("a transport binds to at most one session") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    auto call = transport("call-1");

    sessions.create_session(call, SessionConfig{});
    REQUIRE_THROWS_AS(sessions.create_session(call, SessionConfig{}), SessionError);
    REQUIRE(sessions.size() == 1);
}

TEST_CASE("the session limit is enforced") {
    FakeServices fakes;
    auto options = manager_options();
    options.max_sessions = 2;
    SessionManager sessions(options, PipelineSettings{}, fakes.services());

    sessions.create_session(transport("a"), SessionConfig{});
    const auto second = sessions.create_session(transport("b"), SessionConfig{});
    REQUIRE_THROWS_AS(sessions.create_session(transport("c"), SessionConfig{}), SessionError);

    sessions.destroy_session(second.id);
    REQUIRE_NOTHROW(sessions.create_session(transport("c"), SessionConfig{}));
}

TEST_CASE("only allowed agents can be requested") {
    FakeServices fakes;
    auto options = manager_options();
    options.allowed_agents = {"bank", "support"};
    SessionManager sessions(options, PipelineSettings{}, fakes.services());

    REQUIRE_THROWS_AS(sessions.create_session(transport("a"), SessionConfig{"auto", "pirate"}),
                      SessionError);
    REQUIRE(sessions.create_session(transport("b"), SessionConfig{"auto", "support"}).config.agent ==
            "support");
    REQUIRE(sessions.create_session(transport("c"), SessionConfig{}).config.agent == "bank");
    REQUIRE(sessions.size() == 2);
}

TEST_CASE("destroying a session twice is harmless") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    auto call = transport("call-1");
    const auto info = sessions.create_session(call, SessionConfig{});

    sessions.destroy_session(info.id);
    REQUIRE(call->closed());
    REQUIRE(sessions.size() == 0);
    REQUIRE_FALSE(sessions.session_for_transport("call-1"));

    REQUIRE_NOTHROW(sessions.destroy_session(info.id));
    REQUIRE_NOTHROW(sessions.destroy_session("never-existed"));
}

TEST_CASE("a lost transport tears its session down") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    auto call = transport("call-1");
    auto other = transport("call-2");
    const auto info = sessions.create_session(call, SessionConfig{});
    const auto survivor = sessions.create_session(other, SessionConfig{});

    sessions.handle_transport_lost(info.id, "remote hangup");
    REQUIRE(eventually([&] { return !sessions.find_session(info.id); }));
    REQUIRE(call->closed());
    REQUIRE(sessions.find_session(survivor.id));
    REQUIRE_FALSE(other->closed());
}

TEST_CASE("idle sessions are reaped") {
    FakeServices fakes;
    auto options = manager_options();
    options.idle_timeout = std::chrono::milliseconds(100);
    SessionManager sessions(options, PipelineSettings{}, fakes.services());
    auto call = transport("call-1");
    sessions.create_session(call, SessionConfig{});

    REQUIRE(eventually([&] { return sessions.size() == 0; }));
    REQUIRE(call->closed());
}

TEST_CASE("sessions keep separate backend threads") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    const auto first = sessions.create_session(transport("a"), SessionConfig{});
    const auto second = sessions.create_session(transport("b"), SessionConfig{});

    // Recognition clients are numbered in the order the sessions open them.
    REQUIRE(sessions.route_inbound_frame(first.id, make_frame(1)));
    REQUIRE(eventually([&] { return fakes.recognition->starts() == 1; }));
    REQUIRE(sessions.route_inbound_frame(second.id, make_frame(1)));
    REQUIRE(eventually([&] { return fakes.recognition->starts() == 2; }));
    fakes.recognition->push_to(0, voice_gateway::testing::final_text("hello"));
    fakes.recognition->push_to(1, voice_gateway::testing::final_text("hello"));

    REQUIRE(eventually([&] { return fakes.backend->requests().size() == 2; }));
    const auto requests = fakes.backend->requests();
    REQUIRE(requests[0].thread_handle != requests[1].thread_handle);
    REQUIRE(fakes.backend->threads_created() == 2);

    sessions.shutdown();
    REQUIRE(eventually([&] { return fakes.backend->deleted_threads().size() == 2; }));
}

TEST_CASE("shutdown closes every session and refuses new ones") {
    FakeServices fakes;
    SessionManager sessions(manager_options(), PipelineSettings{}, fakes.services());
    auto a = transport("a");
    auto b = transport("b");
    sessions.create_session(a, SessionConfig{});
    sessions.create_session(b, SessionConfig{});

    sessions.shutdown();
    REQUIRE(sessions.size() == 0);
    REQUIRE(a->closed());
    REQUIRE(b->closed());
    REQUIRE_THROWS_AS(sessions.create_session(transport("c"), SessionConfig{}), SessionError);
}
