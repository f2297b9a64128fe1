#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/backend/sse.hpp"
#include "voice_gateway/errors.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;
using voice_gateway::BackendError;
using voice_gateway::ReplyDeltaTracker;
using voice_gateway::SseParser;

TEST_CASE("sse events may be split anywhere") {
    SseParser parser;
    REQUIRE(parser.feed("event: met").empty());
    REQUIRE(parser.feed("adata\r\ndata: {\"run_id\":").empty());
    const auto events = parser.feed(" \"r1\"}\r\n\r\nevent: end\n\n");

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].event == "metadata");
    REQUIRE(events[0].data == R"({"run_id": "r1"})");
    REQUIRE(events[1].event == "end");
    REQUIRE(events[1].data.empty());
}

TEST_CASE("sse data lines are joined and comments skipped") {
    SseParser parser;
    const auto events = parser.feed(": keep-alive\nid: 7\ndata: first\ndata:second\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event.empty());
    REQUIRE(events[0].id == "7");
    REQUIRE(events[0].data == "first\nsecond");
}

TEST_CASE("finish flushes an unterminated event") {
    SseParser parser;
    REQUIRE(parser.feed("event: values\ndata: {}").empty());
    const auto last = parser.finish();
    REQUIRE(last);
    REQUIRE(last->event == "values");
    REQUIRE(last->data == "{}");
    REQUIRE_FALSE(parser.finish());
}

TEST_CASE("message tuples carry new text only") {
    ReplyDeltaTracker tracker;
    const auto chunk = [](const std::string& text) {
        return json::array({{{"type", "AIMessageChunk"}, {"id", "m1"}, {"content", text}},
                            {{"langgraph_node", "agent"}}});
    };
    REQUIRE(tracker.on_event("messages", chunk("Your balance")) ==
            std::optional<std::string>("Your balance"));
    REQUIRE(tracker.on_event("messages", chunk(" is $500")) ==
            std::optional<std::string>(" is $500"));
    REQUIRE(tracker.on_event("messages", chunk("")) == std::nullopt);
    REQUIRE(tracker.emitted_any());
}

TEST_CASE("partial messages repeat everything sent so far") {
    ReplyDeltaTracker tracker;
    const auto partial = [](const std::string& text) {
        return json::array({{{"type", "ai"}, {"id", "m1"}, {"content", text}}});
    };
    REQUIRE(tracker.on_event("messages/partial", partial("Hel")) ==
            std::optional<std::string>("Hel"));
    REQUIRE(tracker.on_event("messages/partial", partial("Hello")) ==
            std::optional<std::string>("lo"));
    REQUIRE(tracker.on_event("messages/complete", partial("Hello")) == std::nullopt);
}

TEST_CASE("tool calls are skipped and a later message continues after a space") {
    ReplyDeltaTracker tracker;
    REQUIRE(tracker.on_event("messages/partial",
                             json::array({{{"type", "ai"}, {"id", "m1"}, {"content", "Checking."}}})) ==
            std::optional<std::string>("Checking."));

    const json tool_call = json::array({{{"type", "ai"},
                                         {"id", "m2"},
                                         {"content", ""},
                                         {"tool_calls", json::array({{{"name", "balance"}}})}}});
    REQUIRE(tracker.on_event("messages/partial", tool_call) == std::nullopt);

    const json tool_result =
        json::array({{{"type", "tool"}, {"id", "m3"}, {"content", "500.25"}}});
    REQUIRE(tracker.on_event("messages/partial", tool_result) == std::nullopt);

    REQUIRE(tracker.on_event("messages/partial",
                             json::array({{{"type", "ai"},
                                           {"id", "m4"},
                                           {"content", json::array({{{"type", "text"},
                                                                     {"text", "It is $500.25."}}})}}})) ==
            std::optional<std::string>(" It is $500.25."));
}

TEST_CASE("final values are used only when nothing streamed") {
    const json values = {{"messages", json::array({{{"type", "human"}, {"content", "hi"}},
                                                   {{"type", "ai"}, {"content", "Hello there."}}})}};

    ReplyDeltaTracker quiet;
    REQUIRE(quiet.on_event("values", values) == std::optional<std::string>("Hello there."));

    ReplyDeltaTracker streamed;
    streamed.on_event("messages/partial",
                      json::array({{{"type", "ai"}, {"id", "m1"}, {"content", "Hello there."}}}));
    REQUIRE(streamed.on_event("values", values) == std::nullopt);
}

TEST_CASE("an error event fails the run") {
    ReplyDeltaTracker tracker;
    REQUIRE_THROWS_AS(tracker.on_event("error", json{{"message", "agent crashed"}}), BackendError);
    REQUIRE_THROWS_AS(tracker.on_event("error", json("boom")), BackendError);
}
