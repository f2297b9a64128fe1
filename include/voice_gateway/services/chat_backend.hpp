#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

struct ChatRequest {
    std::string thread_handle;
    std::string agent;
    std::string text;
    std::optional<std::string> language;
};

// Streamed reply of one backend run.
class ReplyStream {
public:
    virtual ~ReplyStream() = default;

    // Next text delta. Returns nullopt on the end marker or on cancellation.
    // Throws DeadlineExceeded when nothing arrives within `timeout`,
    // BackendConnectionError when the backend cannot be reached and
    // BackendError on any other failure.
    virtual std::optional<std::string> next_increment(const utils::CancellationToken& token,
                                                      std::chrono::milliseconds timeout) = 0;
    virtual void cancel() = 0;
};

class ChatBackend {
public:
    virtual ~ChatBackend() = default;

    virtual std::string create_thread(const std::string& agent) = 0;
    virtual void delete_thread(const std::string& thread_handle) = 0;
    // Starts a run; network work happens behind the returned stream.
    virtual std::unique_ptr<ReplyStream> start(const ChatRequest& request) = 0;
};

}
