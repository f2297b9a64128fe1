#include "voice_gateway/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace voice_gateway {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

template <typename T>
std::map<std::string, T> parse_json_map(const char* name,
                                        const std::string& raw,
                                        const std::map<std::string, T>& fallback) {
    if (raw.empty()) {
        return fallback;
    }
    auto json = nlohmann::json::parse(raw);
    if (!json.is_object()) {
        throw std::runtime_error(std::string(name) + " must be a JSON object");
    }
    std::map<std::string, T> result;
    for (auto it = json.begin(); it != json.end(); ++it) {
        result[it.key()] = it.value().get<T>();
    }
    return result;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 0);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Variables already present in the environment win over the .env file.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        value = strip_quotes(value);
        set_env_value(key, value);
    }
}

const std::map<std::string, std::string>& default_voices() {
    static const std::map<std::string, std::string> voices = {
        {"en-US", "Magpie-Multilingual.EN-US.Mia.Neutral"},
        {"en-GB", "Magpie-Multilingual.EN-US.Mia.Neutral"},
        {"es-US", "Magpie-Multilingual.ES-US.Isabela"},
        {"es-ES", "Magpie-Multilingual.ES-US.Isabela"},
        {"fr-FR", "Magpie-Multilingual.FR-FR.Pascal"},
        {"de-DE", "Magpie-Multilingual.DE-DE.Aria"},
        {"zh-CN", "Magpie-Multilingual.ZH-CN.Mia"},
    };
    return voices;
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.sip_enabled = get_env_bool("SIP_ENABLED", true);
    config.sip_user = get_env_str("SIP_USER", "voice");
    config.sip_login = get_env_str("SIP_LOGIN", config.sip_user);
    config.sip_domain = get_env_str("SIP_DOMAIN", "sip.linphone.org");
    config.sip_password = get_env_str("SIP_PASSWORD", "password");
    config.sip_caller_id = get_env_optional("SIP_CALLER_ID");
    config.sip_port = get_env_int("SIP_PORT", 5060);
    config.sip_use_tcp = get_env_bool("SIP_USE_TCP", true);
    config.sip_use_ice = get_env_bool("SIP_USE_ICE", false);
    config.sip_null_device = get_env_bool("SIP_NULL_DEVICE", true);
    config.sip_stun_servers = split_csv(get_env_str("SIP_STUN_SERVERS", "stun.l.google.com:19302"));
    config.sip_proxy_servers = split_csv(get_env_str("SIP_PROXY_SERVERS", ""));
    const std::map<std::string, int> default_codecs = {{"opus/48000", 254}, {"G722/16000", 253}};
    config.codecs_priority =
        parse_json_map<int>("CODECS_PRIORITY", get_env_str("CODECS_PRIORITY", ""), default_codecs);
    config.pjsip_log_level = get_env_int("PJSIP_LOG_LEVEL", 1);
    config.ec_tail_len = get_env_int("EC_TAIL_LEN", 200);
    config.events_delay = get_env_double("EVENTS_DELAY", 0.010);
    config.async_delay = get_env_double("ASYNC_DELAY", 0.005);
    config.turn_server_url = get_env_optional("TURN_SERVER_URL");
    if (!config.turn_server_url) {
        config.turn_server_url = get_env_optional("TURN_URL");
    }
    config.turn_username = get_env_optional("TURN_USERNAME");
    config.turn_password = get_env_optional("TURN_PASSWORD");

    config.audio_sample_rate = get_env_int("AUDIO_SAMPLE_RATE", 16000);
    config.audio_frame_ms = get_env_int("AUDIO_FRAME_MS", 20);

    if (const auto vad_path = get_env_optional("VAD_MODEL_PATH")) {
        config.vad_model_path = std::filesystem::path(*vad_path);
    }
    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.5);
    config.vad_min_speech_duration_ms = get_env_int("VAD_MIN_SPEECH_DURATION_MS", 300);
    config.vad_min_silence_duration_ms = get_env_int("VAD_MIN_SILENCE_DURATION_MS", 1500);
    config.vad_speech_prob_window = get_env_int("VAD_SPEECH_PROB_WINDOW", 3);

    config.recognition_url = get_env_str("RECOGNITION_URL", "");
    config.recognition_pool_size = get_env_int("RECOGNITION_POOL_SIZE", 16);
    config.recognition_min_confidence = get_env_double("RECOGNITION_MIN_CONFIDENCE", 0.0);
    config.recognition_final_timeout_ms = get_env_int("RECOGNITION_FINAL_TIMEOUT_MS", 1000);
    config.recognition_reopen_delay_ms = get_env_int("RECOGNITION_REOPEN_DELAY_MS", 500);

    config.synthesis_url = get_env_str("SYNTHESIS_URL", "");
    config.synthesis_pool_size = get_env_int("SYNTHESIS_POOL_SIZE", 16);
    config.synthesis_default_language = get_env_str("SYNTHESIS_DEFAULT_LANGUAGE", "en-US");
    config.synthesis_voices = parse_json_map<std::string>(
        "SYNTHESIS_VOICES", get_env_str("SYNTHESIS_VOICES", ""), default_voices());

    config.backend_url = get_env_str("BACKEND_URL", "http://127.0.0.1:2024");
    config.backend_auth_token = get_env_optional("BACKEND_AUTH_TOKEN");
    config.backend_stream_mode = get_env_str("BACKEND_STREAM_MODE", "messages");
    config.backend_user_email = get_env_str("BACKEND_USER_EMAIL", "voice@example.com");
    config.backend_send_history = get_env_bool("BACKEND_SEND_HISTORY", true);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 10.0);
    config.backend_read_timeout = get_env_double("BACKEND_READ_TIMEOUT", 60.0);
    config.backend_first_token_timeout_ms = get_env_int("BACKEND_FIRST_TOKEN_TIMEOUT_MS", 30000);
    config.backend_idle_timeout_ms = get_env_int("BACKEND_IDLE_TIMEOUT_MS", 15000);

    config.default_language = get_env_str("DEFAULT_LANGUAGE", "auto");
    config.default_agent = get_env_str("DEFAULT_AGENT", "simple_agent");
    config.allowed_agents = split_csv(get_env_str("ALLOWED_AGENTS", ""));
    if (const auto fallback = get_env_optional("FALLBACK_MESSAGE")) {
        config.fallback_message = *fallback;
    }
    config.interruptions_are_allowed = get_env_bool("INTERRUPTIONS_ARE_ALLOWED", true);

    config.max_sessions = get_env_int("MAX_SESSIONS", 32);
    config.session_idle_timeout_ms = get_env_int("SESSION_IDLE_TIMEOUT_MS", 300000);
    config.session_reap_interval_ms = get_env_int("SESSION_REAP_INTERVAL_MS", 1000);
    config.session_teardown_grace_ms = get_env_int("SESSION_TEARDOWN_GRACE_MS", 2000);
    config.pipeline_queue_capacity = get_env_int("PIPELINE_QUEUE_CAPACITY", 64);
    config.egress_queue_frames = get_env_int("EGRESS_QUEUE_FRAMES", 50);
    config.pool_acquire_timeout_ms = get_env_int("POOL_ACQUIRE_TIMEOUT_MS", 5000);

    config.transcript_noise_filter = get_env_bool("TRANSCRIPT_NOISE_FILTER", true);
    config.transcript_history_size = get_env_int("TRANSCRIPT_HISTORY_SIZE", 512);
    config.response_min_clause_chars = get_env_int("RESPONSE_MIN_CLAUSE_CHARS", 40);
    config.response_max_unit_chars = get_env_int("RESPONSE_MAX_UNIT_CHARS", 220);

    return config;
}

void Config::validate() const {
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (recognition_url.empty()) {
        throw std::runtime_error("RECOGNITION_URL is required");
    }
    if (synthesis_url.empty()) {
        throw std::runtime_error("SYNTHESIS_URL is required");
    }
    if (sip_enabled) {
        if (sip_user.empty()) {
            throw std::runtime_error("SIP_USER is required");
        }
        if (sip_domain.empty()) {
            throw std::runtime_error("SIP_DOMAIN is required");
        }
        if (sip_port <= 0) {
            throw std::runtime_error("SIP_PORT must be positive");
        }
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (audio_sample_rate != 8000 && audio_sample_rate != 16000 &&
        audio_sample_rate != 24000 && audio_sample_rate != 48000) {
        throw std::runtime_error("AUDIO_SAMPLE_RATE must be 8000, 16000, 24000 or 48000");
    }
    if (audio_frame_ms <= 0 || audio_frame_ms > 200) {
        throw std::runtime_error("AUDIO_FRAME_MS must be in (0, 200]");
    }
    if (recognition_pool_size <= 0 || synthesis_pool_size <= 0) {
        throw std::runtime_error("pool sizes must be positive");
    }
    if (max_sessions <= 0) {
        throw std::runtime_error("MAX_SESSIONS must be positive");
    }
    if (egress_queue_frames <= 0 || pipeline_queue_capacity <= 0) {
        throw std::runtime_error("queue capacities must be positive");
    }
    if (session_idle_timeout_ms <= 0 || session_reap_interval_ms <= 0) {
        throw std::runtime_error("session timers must be positive");
    }
    if (backend_first_token_timeout_ms <= 0 || backend_idle_timeout_ms <= 0) {
        throw std::runtime_error("backend reply timeouts must be positive");
    }
    if (response_max_unit_chars <= response_min_clause_chars) {
        throw std::runtime_error("RESPONSE_MAX_UNIT_CHARS must exceed RESPONSE_MIN_CLAUSE_CHARS");
    }
    if (default_agent.empty()) {
        throw std::runtime_error("DEFAULT_AGENT is required");
    }
    if (!allowed_agents.empty() &&
        std::find(allowed_agents.begin(), allowed_agents.end(), default_agent) ==
            allowed_agents.end()) {
        throw std::runtime_error("DEFAULT_AGENT must be listed in ALLOWED_AGENTS");
    }
}

}
