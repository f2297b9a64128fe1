#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_gateway {

using Clock = std::chrono::steady_clock;

enum class Direction {
    Inbound,
    Outbound,
};

struct AudioFrame {
    uint64_t sequence = 0;
    Direction direction = Direction::Inbound;
    int sample_rate = 16000;
    std::vector<int16_t> samples;

    std::chrono::microseconds duration() const {
        if (sample_rate <= 0) {
            return std::chrono::microseconds(0);
        }
        return std::chrono::microseconds(
            static_cast<int64_t>(samples.size()) * 1000000 / sample_rate);
    }
};

enum class SpeakerRole {
    User,
    Bot,
};

const char* to_string(SpeakerRole role);
// Role name of the client transcript protocol ("user" / "assistant").
const char* protocol_role(SpeakerRole role);

struct RecognitionIncrement {
    std::string text;
    bool is_final = false;
    double confidence = 1.0;
    std::optional<std::string> language;
};

struct RecognitionEvent {
    enum class Kind {
        Text,
        SpeechStarted,
        SpeechStopped,
        Failure,
    };

    Kind kind = Kind::Text;
    RecognitionIncrement increment;
    std::string error;

    static RecognitionEvent text(RecognitionIncrement increment) {
        RecognitionEvent event;
        event.kind = Kind::Text;
        event.increment = std::move(increment);
        return event;
    }
    static RecognitionEvent speech_started() {
        RecognitionEvent event;
        event.kind = Kind::SpeechStarted;
        return event;
    }
    static RecognitionEvent speech_stopped() {
        RecognitionEvent event;
        event.kind = Kind::SpeechStopped;
        return event;
    }
    static RecognitionEvent failure(std::string message) {
        RecognitionEvent event;
        event.kind = Kind::Failure;
        event.error = std::move(message);
        return event;
    }
};

struct Utterance {
    uint64_t id = 0;
    SpeakerRole speaker = SpeakerRole::User;
    std::vector<std::string> increments;
    bool is_final = false;
    std::optional<std::string> language;
    Clock::time_point started_at{};
    std::optional<Clock::time_point> ended_at;

    std::string text() const;
};

struct TranscriptEvent {
    SpeakerRole speaker = SpeakerRole::User;
    std::string text;
    bool is_final = false;
    uint64_t sequence = 0;
    uint64_t utterance_id = 0;
    std::optional<std::string> language;
};

nlohmann::json to_json(const TranscriptEvent& event);

enum class TurnState {
    Idle,
    UserSpeaking,
    Dispatched,
    BotSpeaking,
    Closing,
};

const char* to_string(TurnState state);

enum class SessionState {
    Connecting,
    Active,
    Closing,
    Closed,
};

const char* to_string(SessionState state);

struct SessionConfig {
    // "auto" or a BCP-47 tag; "multi" is read as "auto".
    std::string language = "auto";
    std::string agent;

    bool is_auto_language() const { return language == "auto"; }
};

SessionConfig normalize_session_config(SessionConfig config, const std::string& default_agent);

struct SessionInfo {
    std::string id;
    std::string transport_id;
    SessionConfig config;
    SessionState state = SessionState::Connecting;
    TurnState turn_state = TurnState::Idle;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_activity{};
};

nlohmann::json to_json(const SessionInfo& info);

}
