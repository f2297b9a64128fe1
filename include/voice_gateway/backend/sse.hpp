#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_gateway {

struct SseEvent {
    std::string event;
    std::string data;
    std::string id;
};

// Incremental text/event-stream decoder; input may be split anywhere.
class SseParser {
public:
    std::vector<SseEvent> feed(const char* data, size_t length);
    std::vector<SseEvent> feed(const std::string& chunk) { return feed(chunk.data(), chunk.size()); }
    // Flushes an event left without its terminating blank line.
    std::optional<SseEvent> finish();

private:
    void process_line(std::string line, std::vector<SseEvent>& out);

    std::string buffer_;
    SseEvent current_;
    bool has_data_ = false;
};

// Turns the cumulative assistant messages of a LangGraph run into text
// deltas. Messages carrying tool calls are skipped; a later assistant
// message continues the reply after a space.
class ReplyDeltaTracker {
public:
    // Returns the new text carried by the event, if any.
    std::optional<std::string> on_event(const std::string& event, const nlohmann::json& data);

    bool emitted_any() const { return emitted_any_; }

private:
    // `cumulative`: the content repeats everything sent so far for the message.
    std::optional<std::string> on_message(const nlohmann::json& message, bool cumulative);
    std::optional<std::string> on_final_text(const std::string& text);

    std::string message_id_;
    std::string message_text_;
    bool emitted_any_ = false;
};

// Text of a message "content" that is either a string or a list of parts.
std::string message_content_text(const nlohmann::json& content);

}
