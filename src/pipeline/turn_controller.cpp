#include "voice_gateway/pipeline/turn_controller.hpp"

#include <utility>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"

namespace voice_gateway {

namespace {

bool is_allowed(TurnState from, TurnState to) {
    if (from == TurnState::Closing) {
        return false;
    }
    if (to == TurnState::Closing) {
        return true;
    }
    switch (from) {
        case TurnState::Idle:
            return to == TurnState::UserSpeaking;
        case TurnState::UserSpeaking:
            return to == TurnState::Dispatched || to == TurnState::Idle;
        case TurnState::Dispatched:
            return to == TurnState::BotSpeaking || to == TurnState::Idle ||
                   to == TurnState::UserSpeaking;
        case TurnState::BotSpeaking:
            return to == TurnState::Idle || to == TurnState::UserSpeaking;
        case TurnState::Closing:
            return false;
    }
    return false;
}

}

std::optional<SpeakerRole> speaker_losing_turn(TurnState from, TurnState to) {
    // The reply's bot utterance stays open across its first audio.
    if (from == to || (from == TurnState::Dispatched && to == TurnState::BotSpeaking)) {
        return std::nullopt;
    }
    if (from == TurnState::UserSpeaking) {
        return SpeakerRole::User;
    }
    if (from == TurnState::Dispatched || from == TurnState::BotSpeaking) {
        return SpeakerRole::Bot;
    }
    return std::nullopt;
}

TurnController::TurnController(std::string session_id) : session_id_(std::move(session_id)) {}

void TurnController::set_interrupt_handlers(InterruptHandlers handlers) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_ = std::move(handlers);
}

void TurnController::set_transition_listener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

bool TurnController::transition_locked(TurnState from, TurnState to) {
    if (state_ != from || !is_allowed(from, to)) {
        logging::debug("Ignoring turn signal",
                       {kv("session_id", session_id_),
                        kv("state", to_string(state_)),
                        kv("requested", to_string(to))});
        return false;
    }
    state_ = to;
    logging::debug("Turn state changed",
                   {kv("session_id", session_id_),
                    kv("from", to_string(from)),
                    kv("to", to_string(to)),
                    kv("turn_id", turn_id_)});
    if (listener_) {
        listener_(from, to, turn_id_);
    }
    return true;
}

bool TurnController::signal_user_speech_start() {
    std::lock_guard<std::mutex> lock(mutex_);
    return transition_locked(TurnState::Idle, TurnState::UserSpeaking);
}

std::optional<uint64_t> TurnController::signal_user_speech_end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TurnState::UserSpeaking) {
        logging::debug("Ignoring user speech end",
                       {kv("session_id", session_id_), kv("state", to_string(state_))});
        return std::nullopt;
    }
    ++turn_id_;
    transition_locked(TurnState::UserSpeaking, TurnState::Dispatched);
    return turn_id_;
}

bool TurnController::signal_bot_speech_start(uint64_t turn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (turn_id != turn_id_) {
        logging::debug("Ignoring bot speech start of stale turn",
                       {kv("session_id", session_id_), kv("turn_id", turn_id),
                        kv("current_turn", turn_id_)});
        return false;
    }
    return transition_locked(TurnState::Dispatched, TurnState::BotSpeaking);
}

bool TurnController::signal_bot_speech_end(uint64_t turn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (turn_id != turn_id_) {
        logging::debug("Ignoring bot speech end of stale turn",
                       {kv("session_id", session_id_), kv("turn_id", turn_id),
                        kv("current_turn", turn_id_)});
        return false;
    }
    if (state_ == TurnState::Dispatched) {
        return transition_locked(TurnState::Dispatched, TurnState::Idle);
    }
    return transition_locked(TurnState::BotSpeaking, TurnState::Idle);
}

bool TurnController::request_interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TurnState::BotSpeaking && state_ != TurnState::Dispatched) {
        return false;
    }
    const auto from = state_;
    const auto turn = turn_id_;
    logging::info("Barge-in",
                  {kv("session_id", session_id_), kv("turn_id", turn),
                   kv("state", to_string(from))});
    Metrics::instance().increment_event("interrupt");

    if (handlers_.cancel_backend) {
        handlers_.cancel_backend(turn);
    }
    if (handlers_.discard_output) {
        handlers_.discard_output(turn);
    }
    if (handlers_.finalize_bot_utterance) {
        handlers_.finalize_bot_utterance(turn);
    }
    return transition_locked(from, TurnState::UserSpeaking);
}

bool TurnController::abandon_user_turn() {
    std::lock_guard<std::mutex> lock(mutex_);
    return transition_locked(TurnState::UserSpeaking, TurnState::Idle);
}

void TurnController::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == TurnState::Closing) {
        return;
    }
    transition_locked(state_, TurnState::Closing);
}

TurnState TurnController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t TurnController::current_turn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turn_id_;
}

}
