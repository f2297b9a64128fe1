#include "voice_gateway/session/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace voice_gateway {

namespace {

std::string iso_timestamp(std::chrono::system_clock::time_point point) {
    const auto time_t = std::chrono::system_clock::to_time_t(point);
    std::tm tm_value{};
    gmtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%SZ");
    return stream.str();
}

}

const char* to_string(SpeakerRole role) {
    switch (role) {
        case SpeakerRole::User:
            return "user";
        case SpeakerRole::Bot:
            return "bot";
    }
    return "unknown";
}

const char* protocol_role(SpeakerRole role) {
    return role == SpeakerRole::User ? "user" : "assistant";
}

std::string Utterance::text() const {
    std::string result;
    for (const auto& increment : increments) {
        result += increment;
    }
    return result;
}

nlohmann::json to_json(const TranscriptEvent& event) {
    nlohmann::json json = {
        {"type", "transcription"},
        {"role", protocol_role(event.speaker)},
        {"text", event.text},
        {"final", event.is_final},
        {"sequence", event.sequence},
        {"utterance_id", event.utterance_id},
    };
    json["language"] = event.language ? nlohmann::json(*event.language) : nlohmann::json();
    return json;
}

const char* to_string(TurnState state) {
    switch (state) {
        case TurnState::Idle:
            return "IDLE";
        case TurnState::UserSpeaking:
            return "USER_SPEAKING";
        case TurnState::Dispatched:
            return "DISPATCHED";
        case TurnState::BotSpeaking:
            return "BOT_SPEAKING";
        case TurnState::Closing:
            return "CLOSING";
    }
    return "UNKNOWN";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting:
            return "CONNECTING";
        case SessionState::Active:
            return "ACTIVE";
        case SessionState::Closing:
            return "CLOSING";
        case SessionState::Closed:
            return "CLOSED";
    }
    return "UNKNOWN";
}

SessionConfig normalize_session_config(SessionConfig config, const std::string& default_agent) {
    std::string lowered = config.language;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered.empty() || lowered == "auto" || lowered == "multi") {
        config.language = "auto";
    }
    if (config.agent.empty()) {
        config.agent = default_agent;
    }
    return config;
}

nlohmann::json to_json(const SessionInfo& info) {
    return {
        {"id", info.id},
        {"transport_id", info.transport_id},
        {"language", info.config.language},
        {"agent", info.config.agent},
        {"state", to_string(info.state)},
        {"turn_state", to_string(info.turn_state)},
        {"created_at", iso_timestamp(info.created_at)},
        {"last_activity", iso_timestamp(info.last_activity)},
    };
}

}
