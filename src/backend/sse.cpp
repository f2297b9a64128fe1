#include "voice_gateway/backend/sse.hpp"

#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/utils/text.hpp"

namespace voice_gateway {

namespace {

bool is_assistant(const nlohmann::json& message) {
    std::string kind;
    if (message.contains("type") && message["type"].is_string()) {
        kind = message["type"].get<std::string>();
    } else if (message.contains("role") && message["role"].is_string()) {
        kind = message["role"].get<std::string>();
    }
    return kind == "ai" || kind == "assistant" || kind == "AIMessage" || kind == "AIMessageChunk";
}

bool has_tool_calls(const nlohmann::json& message) {
    const auto it = message.find("tool_calls");
    return it != message.end() && it->is_array() && !it->empty();
}

}

std::vector<SseEvent> SseParser::feed(const char* data, size_t length) {
    std::vector<SseEvent> out;
    buffer_.append(data, length);
    size_t start = 0;
    while (true) {
        const auto end = buffer_.find('\n', start);
        if (end == std::string::npos) {
            break;
        }
        std::string line = buffer_.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        process_line(std::move(line), out);
        start = end + 1;
    }
    buffer_.erase(0, start);
    return out;
}

std::optional<SseEvent> SseParser::finish() {
    std::vector<SseEvent> out;
    if (!buffer_.empty()) {
        auto line = std::move(buffer_);
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        process_line(std::move(line), out);
    }
    process_line("", out);
    if (out.empty()) {
        return std::nullopt;
    }
    return out.back();
}

void SseParser::process_line(std::string line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        if (has_data_ || !current_.event.empty()) {
            out.push_back(std::move(current_));
        }
        current_ = SseEvent{};
        has_data_ = false;
        return;
    }
    if (line.front() == ':') {
        return;
    }
    std::string field = line;
    std::string value;
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
    }
    if (field == "event") {
        current_.event = value;
    } else if (field == "data") {
        if (has_data_) {
            current_.data += '\n';
        }
        current_.data += value;
        has_data_ = true;
    } else if (field == "id") {
        current_.id = value;
    }
}

std::string message_content_text(const nlohmann::json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    std::string text;
    if (content.is_array()) {
        for (const auto& part : content) {
            if (part.is_string()) {
                text += part.get<std::string>();
            } else if (part.is_object() && part.value("type", "text") == "text" &&
                       part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
    }
    return text;
}

std::optional<std::string> ReplyDeltaTracker::on_event(const std::string& event,
                                                       const nlohmann::json& data) {
    if (event == "error") {
        std::string message = "backend run failed";
        if (data.is_object()) {
            for (const char* key : {"message", "error"}) {
                if (data.contains(key) && data[key].is_string()) {
                    message = data[key].get<std::string>();
                    break;
                }
            }
        } else if (data.is_string()) {
            message = data.get<std::string>();
        }
        throw BackendError(message);
    }

    if (event == "messages") {
        // messages-tuple mode: [chunk, metadata], the chunk holds new text only.
        if (data.is_array() && data.size() == 2 && data[0].is_object()) {
            return on_message(data[0], false);
        }
        if (data.is_array() && !data.empty()) {
            return on_message(data.back(), true);
        }
        return std::nullopt;
    }

    if (event == "messages/partial" || event == "messages/complete") {
        if (data.is_array() && !data.empty()) {
            return on_message(data.back(), true);
        }
        if (data.is_object()) {
            return on_message(data, true);
        }
        return std::nullopt;
    }

    if (event == "values") {
        if (data.is_object() && data.contains("messages") && data["messages"].is_array() &&
            !data["messages"].empty()) {
            const auto& last = data["messages"].back();
            if (last.is_object() && is_assistant(last) && !has_tool_calls(last)) {
                return on_final_text(message_content_text(last.value("content", nlohmann::json())));
            }
            return std::nullopt;
        }
        if (data.is_object() && data.contains("content") && is_assistant(data)) {
            return on_final_text(message_content_text(data["content"]));
        }
        if (data.is_string()) {
            return on_final_text(data.get<std::string>());
        }
    }
    return std::nullopt;
}

std::optional<std::string> ReplyDeltaTracker::on_message(const nlohmann::json& message,
                                                         bool cumulative) {
    if (!message.is_object() || !is_assistant(message) || has_tool_calls(message)) {
        return std::nullopt;
    }
    auto content = message_content_text(message.value("content", nlohmann::json()));
    const auto id = message.contains("id") && message["id"].is_string()
                        ? message["id"].get<std::string>()
                        : std::string();
    if (!cumulative) {
        content = (id == message_id_ ? message_text_ : std::string()) + content;
    }
    if (utils::is_blank(content)) {
        return std::nullopt;
    }
    std::string prefix;
    if (id != message_id_) {
        if (emitted_any_ && !message_text_.empty()) {
            prefix = " ";
        }
        message_id_ = id;
        message_text_.clear();
    }
    if (content.size() <= message_text_.size()) {
        return std::nullopt;
    }
    auto delta = content.substr(message_text_.size());
    message_text_ = content;
    emitted_any_ = true;
    return prefix + delta;
}

std::optional<std::string> ReplyDeltaTracker::on_final_text(const std::string& text) {
    if (emitted_any_ || utils::is_blank(text)) {
        return std::nullopt;
    }
    emitted_any_ = true;
    message_text_ = text;
    return text;
}

}
