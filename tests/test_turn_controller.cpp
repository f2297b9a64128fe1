#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/pipeline/turn_controller.hpp"

#include <string>
#include <vector>

using voice_gateway::SpeakerRole;
using voice_gateway::TurnController;
using voice_gateway::TurnState;

TEST_CASE("a full turn walks through every state") {
    TurnController turn("s1");
    std::vector<TurnState> states;
    turn.set_transition_listener(
        [&](TurnState, TurnState to, uint64_t) { states.push_back(to); });

    REQUIRE(turn.signal_user_speech_start());
    const auto turn_id = turn.signal_user_speech_end();
    REQUIRE(turn_id);
    REQUIRE(turn.signal_bot_speech_start(*turn_id));
    REQUIRE(turn.signal_bot_speech_end(*turn_id));

    REQUIRE(states == std::vector<TurnState>{TurnState::UserSpeaking, TurnState::Dispatched,
                                             TurnState::BotSpeaking, TurnState::Idle});
}

TEST_CASE("signals invalid in the current state are ignored") {
    TurnController turn("s1");
    REQUIRE_FALSE(turn.signal_user_speech_end());
    REQUIRE_FALSE(turn.signal_bot_speech_start(0));
    REQUIRE_FALSE(turn.request_interrupt());
    REQUIRE(turn.state() == TurnState::Idle);

    turn.signal_user_speech_start();
    REQUIRE_FALSE(turn.signal_user_speech_start());
    REQUIRE(turn.state() == TurnState::UserSpeaking);
}

TEST_CASE("stale bot signals do not move a newer turn") {
    TurnController turn("s1");
    turn.signal_user_speech_start();
    const auto first = *turn.signal_user_speech_end();
    turn.request_interrupt();
    const auto second = *turn.signal_user_speech_end();
    REQUIRE(second == first + 1);

    REQUIRE_FALSE(turn.signal_bot_speech_start(first));
    REQUIRE_FALSE(turn.signal_bot_speech_end(first));
    REQUIRE(turn.state() == TurnState::Dispatched);
}

TEST_CASE("a reply without audio returns to idle") {
    TurnController turn("s1");
    turn.signal_user_speech_start();
    const auto id = *turn.signal_user_speech_end();
    REQUIRE(turn.signal_bot_speech_end(id));
    REQUIRE(turn.state() == TurnState::Idle);
}

TEST_CASE("barge-in runs the interrupt handlers in order before the transition") {
    TurnController turn("s1");
    std::vector<std::string> calls;
    TurnController::InterruptHandlers handlers;
    handlers.cancel_backend = [&](uint64_t) { calls.push_back("cancel"); };
    handlers.discard_output = [&](uint64_t) { calls.push_back("discard"); };
    handlers.finalize_bot_utterance = [&](uint64_t) { calls.push_back("finalize"); };
    turn.set_interrupt_handlers(handlers);
    turn.set_transition_listener([&](TurnState, TurnState to, uint64_t) {
        if (to == TurnState::UserSpeaking) {
            calls.push_back("user");
        }
    });

    turn.signal_user_speech_start();
    const auto id = *turn.signal_user_speech_end();
    turn.signal_bot_speech_start(id);
    calls.clear();

    REQUIRE(turn.request_interrupt());
    REQUIRE(calls == std::vector<std::string>{"cancel", "discard", "finalize", "user"});
    REQUIRE(turn.state() == TurnState::UserSpeaking);
}

TEST_CASE("abandoned user turn goes back to idle without a turn id") {
    TurnController turn("s1");
    turn.signal_user_speech_start();
    REQUIRE(turn.abandon_user_turn());
    REQUIRE(turn.state() == TurnState::Idle);
    REQUIRE(turn.current_turn() == 0);
}

TEST_CASE("closing is terminal") {
    TurnController turn("s1");
    turn.signal_user_speech_start();
    turn.close();
    REQUIRE(turn.state() == TurnState::Closing);
    REQUIRE_FALSE(turn.signal_user_speech_end());
    REQUIRE_FALSE(turn.signal_user_speech_start());
    REQUIRE_FALSE(turn.request_interrupt());
    turn.close();
    REQUIRE(turn.state() == TurnState::Closing);
}

TEST_CASE("speaker_losing_turn names who yields") {
    using voice_gateway::speaker_losing_turn;
    REQUIRE(speaker_losing_turn(TurnState::UserSpeaking, TurnState::Dispatched) ==
            SpeakerRole::User);
    REQUIRE(speaker_losing_turn(TurnState::BotSpeaking, TurnState::UserSpeaking) ==
            SpeakerRole::Bot);
    REQUIRE(speaker_losing_turn(TurnState::Dispatched, TurnState::UserSpeaking) ==
            SpeakerRole::Bot);
    REQUIRE(speaker_losing_turn(TurnState::Dispatched, TurnState::Idle) == SpeakerRole::Bot);
    REQUIRE_FALSE(speaker_losing_turn(TurnState::Idle, TurnState::UserSpeaking));
    REQUIRE_FALSE(speaker_losing_turn(TurnState::Dispatched, TurnState::BotSpeaking));
}
