#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_gateway/backend/client.hpp"
#include "voice_gateway/services/chat_backend.hpp"

namespace voice_gateway {

struct Config;

// ChatBackend over a LangGraph server: threads keep the conversation, runs
// are streamed as server-sent events.
class LangGraphBackend : public ChatBackend {
public:
    struct Options {
        std::string base_url = "http://127.0.0.1:2024";
        std::optional<std::string> authorization_token;
        std::string stream_mode = "messages";
        std::string user_email;
        // Resend the thread's stored messages with every run (functional
        // graphs take the whole message list as input).
        bool send_history = true;
        BackendRequestOptions request;

        static Options from_config(const Config& config);
    };

    explicit LangGraphBackend(Options options);

    std::string create_thread(const std::string& agent) override;
    void delete_thread(const std::string& thread_handle) override;
    std::unique_ptr<ReplyStream> start(const ChatRequest& request) override;

    // Assistants known to the server, normalized to
    // {"assistant_id", "graph_id", "name", "display_name"}.
    nlohmann::json list_assistants();

private:
    Options options_;
    std::shared_ptr<BackendClient> client_;
};

}
