#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace voice_gateway {

struct Config {
    // Logging
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;

    // REST API
    int rest_api_port = 8000;
    std::optional<std::string> authorization_token;

    // SIP transport
    bool sip_enabled = true;
    std::string sip_user;
    std::string sip_login;
    std::string sip_domain;
    std::string sip_password;
    std::optional<std::string> sip_caller_id;
    int sip_port = 5060;
    bool sip_use_tcp = true;
    bool sip_use_ice = false;
    bool sip_null_device = true;
    std::vector<std::string> sip_stun_servers;
    std::vector<std::string> sip_proxy_servers;
    std::map<std::string, int> codecs_priority;
    int pjsip_log_level = 1;
    int ec_tail_len = 200;
    double events_delay = 0.010;
    double async_delay = 0.005;
    std::optional<std::string> turn_server_url;
    std::optional<std::string> turn_username;
    std::optional<std::string> turn_password;

    // Audio
    int audio_sample_rate = 16000;
    int audio_frame_ms = 20;

    // Voice activity detection
    std::optional<std::filesystem::path> vad_model_path;
    double vad_threshold = 0.5;
    int vad_min_speech_duration_ms = 300;
    int vad_min_silence_duration_ms = 1500;
    int vad_speech_prob_window = 3;

    // Recognition
    std::string recognition_url;
    int recognition_pool_size = 16;
    double recognition_min_confidence = 0.0;
    int recognition_final_timeout_ms = 1000;
    int recognition_reopen_delay_ms = 500;

    // Synthesis
    std::string synthesis_url;
    int synthesis_pool_size = 16;
    std::string synthesis_default_language = "en-US";
    std::map<std::string, std::string> synthesis_voices;

    // Conversational backend
    std::string backend_url;
    std::optional<std::string> backend_auth_token;
    std::string backend_stream_mode = "messages";
    std::string backend_user_email = "voice@example.com";
    bool backend_send_history = true;
    double backend_connect_timeout = 10.0;
    double backend_read_timeout = 60.0;
    int backend_first_token_timeout_ms = 30000;
    int backend_idle_timeout_ms = 15000;

    // Session defaults
    std::string default_language = "auto";
    std::string default_agent = "simple_agent";
    std::vector<std::string> allowed_agents;
    std::string fallback_message =
        "I'm sorry, I'm having trouble reaching the assistant right now. "
        "Please try again in a moment.";
    bool interruptions_are_allowed = true;

    // Session manager and pipeline
    int max_sessions = 32;
    int session_idle_timeout_ms = 300000;
    int session_reap_interval_ms = 1000;
    int session_teardown_grace_ms = 2000;
    int pipeline_queue_capacity = 64;
    int egress_queue_frames = 50;
    int pool_acquire_timeout_ms = 5000;

    // Transcript and reply shaping
    bool transcript_noise_filter = true;
    int transcript_history_size = 512;
    int response_min_clause_chars = 40;
    int response_max_unit_chars = 220;

    static Config load();
    void validate() const;
};

}
