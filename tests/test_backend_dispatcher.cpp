#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/pipeline/backend_dispatcher.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace voice_gateway;
using voice_gateway::testing::FakeChatBackend;
using voice_gateway::testing::ScriptedReply;
using voice_gateway::testing::eventually;

namespace {

Utterance user_utterance(const std::string& text, std::optional<std::string> language = {}) {
    Utterance utterance;
    utterance.id = 1;
    utterance.increments.push_back(text);
    utterance.is_final = true;
    utterance.language = std::move(language);
    return utterance;
}

SessionConfig session_config(const std::string& agent, const std::string& language) {
    SessionConfig config;
    config.agent = agent;
    config.language = language;
    return config;
}

BackendDispatcher::Options fast_options() {
    BackendDispatcher::Options options;
    options.connect_timeout = std::chrono::milliseconds(500);
    options.first_token_timeout = std::chrono::milliseconds(100);
    options.idle_timeout = std::chrono::milliseconds(100);
    return options;
}

std::vector<std::string> drain(DispatchedReply& reply, const utils::CancellationToken& token = {}) {
    std::vector<std::string> deltas;
    while (auto delta = reply.next_increment(token)) {
        deltas.push_back(*delta);
    }
    return deltas;
}

}

TEST_CASE("a reply streams every delta in order") {
    auto backend = std::make_shared<FakeChatBackend>();
    backend->script(ScriptedReply::text({"Your balance", " is $500", ".25."}));
    BackendDispatcher dispatcher("s1", backend, fast_options());

    auto reply = dispatcher.dispatch(session_config("bank", "en-US"),
                                     user_utterance("what is my balance"), {});
    REQUIRE(drain(*reply) == std::vector<std::string>{"Your balance", " is $500", ".25."});
    REQUIRE(reply->attempts() == 1);
    REQUIRE(reply->forwarded_any());

    const auto requests = backend->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].agent == "bank");
    REQUIRE(requests[0].text == "what is my balance");
    REQUIRE(requests[0].language == std::optional<std::string>("en-US"));
    REQUIRE(requests[0].thread_handle == "bank-thread-1");
}

TEST_CASE("a connection failure before the first delta is retried once") {
    auto backend = std::make_shared<FakeChatBackend>();
    backend->script(ScriptedReply::failing(ScriptedReply::Failure::Connection));
    backend->script(ScriptedReply::text({"Hello."}));
    BackendDispatcher dispatcher("s1", backend, fast_options());

    auto reply = dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hi"), {});
    REQUIRE(drain(*reply) == std::vector<std::string>{"Hello."});
    REQUIRE(reply->attempts() == 2);
    REQUIRE(backend->requests().size() == 2);
    // The retry runs on the thread created by the first attempt.
    REQUIRE(backend->threads_created() == 1);
}

TEST_CASE("two connection failures make the backend unavailable") {
    auto backend = std::make_shared<FakeChatBackend>();
    backend->script(ScriptedReply::failing(ScriptedReply::Failure::Connection));
    backend->script(ScriptedReply::failing(ScriptedReply::Failure::Connection));
    BackendDispatcher dispatcher("s1", backend, fast_options());

    auto reply = dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hi"), {});
    REQUIRE_THROWS_AS(reply->next_increment({}), BackendUnavailable);
    REQUIRE(reply->attempts() == 2);
    REQUIRE_FALSE(reply->forwarded_any());
}

TEST_CASE("a failure after the first delta is not retried") {
    auto backend = std::make_shared<FakeChatBackend>();
    backend->script(ScriptedReply::failing(ScriptedReply::Failure::Connection, {"Let me check"}));
    BackendDispatcher dispatcher("s1", backend, fast_options());

    auto reply = dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hi"), {});
    REQUIRE(reply->next_increment({}) == std::optional<std::string>("Let me check"));
    REQUIRE_THROWS_AS(reply->next_increment({}), BackendUnavailable);
    REQUIRE(backend->requests().size() == 1);
}

TEST_CASE("backend errors other than connection failures are not retried") {
    auto backend = std::make_shared<FakeChatBackend>();
    backend->script(ScriptedReply::failing(ScriptedReply::Failure::Backend));
    BackendDispatcher dispatcher("s1", backend, fast_options());

    auto reply = dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hi"), {});
    REQUIRE_THROWS_AS(reply->next_increment({}), BackendUnavailable);
    REQUIRE(reply->attempts() == 1);
}

TEST_CASE("a backend that never answers times out") {
    auto backend = std::make_shared<FakeChatBackend>();
    backend->script(ScriptedReply::failing(ScriptedReply::Failure::Stall));
    BackendDispatcher dispatcher("s1", backend, fast_options());

    auto reply = dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hi"), {});
    REQUIRE_THROWS_AS(reply->next_increment({}), BackendUnavailable);
}

TEST_CASE("a cancelled reply ends without an error") {
    auto backend = std::make_shared<FakeChatBackend>();
    backend->script(ScriptedReply::failing(ScriptedReply::Failure::Stall));
    BackendDispatcher dispatcher("s1", backend, fast_options());
    utils::CancellationSource source;

    auto reply = dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hi"),
                                     source.token());
    source.cancel();
    REQUIRE_FALSE(reply->next_increment(source.token()));
}

TEST_CASE("bindings are reused per agent and language mode") {
    auto backend = std::make_shared<FakeChatBackend>();
    BackendDispatcher dispatcher("s1", backend, fast_options());

    drain(*dispatcher.dispatch(session_config("bank", "en-US"), user_utterance("one"), {}));
    drain(*dispatcher.dispatch(session_config("bank", "en-US"), user_utterance("two"), {}));
    REQUIRE(backend->threads_created() == 1);

    drain(*dispatcher.dispatch(session_config("bank", "de-DE"), user_utterance("drei"), {}));
    drain(*dispatcher.dispatch(session_config("support", "en-US"), user_utterance("four"), {}));
    REQUIRE(backend->threads_created() == 3);
    REQUIRE(dispatcher.routing_table().size() == 3);

    const auto binding = dispatcher.routing_table().find("bank", "de-DE");
    REQUIRE(binding);
    REQUIRE(binding->thread_handle == "bank-thread-2");
    REQUIRE_FALSE(dispatcher.routing_table().find("support", "de-DE"));
}

TEST_CASE("sessions never share backend threads") {
    auto backend = std::make_shared<FakeChatBackend>();
    BackendDispatcher first("s1", backend, fast_options());
    BackendDispatcher second("s2", backend, fast_options());

    drain(*first.dispatch(session_config("bank", "auto"), user_utterance("hi"), {}));
    drain(*second.dispatch(session_config("bank", "auto"), user_utterance("hi"), {}));

    const auto requests = backend->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].thread_handle != requests[1].thread_handle);
    REQUIRE(first.routing_table().find("bank", "auto")->thread_handle == requests[0].thread_handle);
    REQUIRE(second.routing_table().find("bank", "auto")->thread_handle ==
            requests[1].thread_handle);
}

TEST_CASE("auto language forwards the detected language") {
    auto backend = std::make_shared<FakeChatBackend>();
    BackendDispatcher dispatcher("s1", backend, fast_options());

    drain(*dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hallo", "de"), {}));
    drain(*dispatcher.dispatch(session_config("bank", "auto"), user_utterance("hello"), {}));

    const auto requests = backend->requests();
    REQUIRE(requests[0].language == std::optional<std::string>("de"));
    REQUIRE_FALSE(requests[1].language);
}

TEST_CASE("releasing bindings deletes every backend thread") {
    auto backend = std::make_shared<FakeChatBackend>();
    BackendDispatcher dispatcher("s1", backend, fast_options());
    drain(*dispatcher.dispatch(session_config("bank", "en-US"), user_utterance("one"), {}));
    drain(*dispatcher.dispatch(session_config("bank", "de-DE"), user_utterance("zwei"), {}));

    dispatcher.release_bindings();
    REQUIRE(dispatcher.routing_table().size() == 0);
    REQUIRE(eventually([&] { return backend->deleted_threads().size() == 2; }));
}
