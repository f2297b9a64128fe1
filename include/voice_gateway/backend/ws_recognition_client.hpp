#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "voice_gateway/services/recognition_client.hpp"

namespace voice_gateway {

// Streaming recognition over a WebSocket (websocketpp/asio). Audio goes up as
// binary PCM16 frames; the service answers with JSON messages of type
// "transcript", "speech_started", "speech_stopped" or "error".
class WsRecognitionClient : public RecognitionClient {
public:
    struct Options {
        std::string base_url;
        std::chrono::milliseconds connect_timeout{5000};
    };

    explicit WsRecognitionClient(Options options);
    ~WsRecognitionClient() override;

    void start(const std::string& language, int sample_rate) override;
    void send_audio(const AudioFrame& frame) override;
    std::optional<RecognitionEvent> next_increment(const utils::CancellationToken& token) override;
    void cancel() override;

    std::string make_stream_url(const std::string& language, int sample_rate) const;

private:
    struct Connection;

    std::shared_ptr<Connection> current() const;

    Options options_;
    mutable std::mutex mutex_;
    std::shared_ptr<Connection> connection_;
};

// Parses one service message; nullopt for message types that carry nothing.
std::optional<RecognitionEvent> parse_recognition_message(const std::string& payload);

}
