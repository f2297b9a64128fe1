#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "voice_gateway/session/types.hpp"

namespace voice_gateway {

// Speaker that gives up the turn on a transition, if any.
std::optional<SpeakerRole> speaker_losing_turn(TurnState from, TurnState to);

// Owns the speaking rights of one session. All signals are serialized; a
// signal that is not valid in the current state is ignored.
class TurnController {
public:
    struct InterruptHandlers {
        std::function<void(uint64_t turn_id)> cancel_backend;
        std::function<void(uint64_t turn_id)> discard_output;
        std::function<void(uint64_t turn_id)> finalize_bot_utterance;
    };

    // Called with the transition lock held; must not signal back.
    using TransitionListener = std::function<void(TurnState from, TurnState to, uint64_t turn_id)>;

    explicit TurnController(std::string session_id);

    void set_interrupt_handlers(InterruptHandlers handlers);
    void set_transition_listener(TransitionListener listener);

    bool signal_user_speech_start();
    // Dispatches the user turn; returns the new bot turn id.
    std::optional<uint64_t> signal_user_speech_end();
    bool signal_bot_speech_start(uint64_t turn_id);
    bool signal_bot_speech_end(uint64_t turn_id);
    bool request_interrupt();
    bool abandon_user_turn();
    void close();

    TurnState state() const;
    uint64_t current_turn() const;

private:
    bool transition_locked(TurnState from, TurnState to);

    std::string session_id_;
    mutable std::mutex mutex_;
    TurnState state_ = TurnState::Idle;
    uint64_t turn_id_ = 0;
    InterruptHandlers handlers_;
    TransitionListener listener_;
};

}
