#include "voice_gateway/pipeline/transcript_emitter.hpp"

#include <exception>
#include <utility>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/text.hpp"

namespace voice_gateway {

TranscriptEmitter::TranscriptEmitter(std::string session_id,
                                     bool noise_filter,
                                     size_t history_size)
    : session_id_(std::move(session_id)),
      noise_filter_(noise_filter),
      history_size_(history_size == 0 ? 1 : history_size) {}

bool TranscriptEmitter::is_noise(const Utterance& utterance) const {
    return noise_filter_ && utterance.speaker == SpeakerRole::User &&
           utils::is_recognition_noise(utterance.text());
}

bool TranscriptEmitter::emit(const Utterance& utterance) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    TranscriptEvent event;
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& last_final = last_final_id_[slot(utterance.speaker)];
        if (utterance.id <= last_final) {
            logging::debug("Dropping update of closed utterance",
                           {kv("session_id", session_id_),
                            kv("utterance_id", utterance.id),
                            kv("speaker", to_string(utterance.speaker))});
            return false;
        }
        if (utterance.is_final) {
            last_final = utterance.id;
        }

        const auto text = utterance.text();
        if (utils::is_blank(text)) {
            return false;
        }
        if (is_noise(utterance)) {
            logging::debug("Filtered recognition noise",
                           {kv("session_id", session_id_), kv("text", text)});
            return false;
        }

        event.speaker = utterance.speaker;
        event.text = text;
        event.is_final = utterance.is_final;
        event.sequence = ++sequence_;
        event.utterance_id = utterance.id;
        event.language = utterance.language;

        history_.push_back(event);
        while (history_.size() > history_size_) {
            history_.pop_front();
        }
        subscribers.reserve(subscribers_.size());
        for (const auto& item : subscribers_) {
            subscribers.push_back(item.second);
        }
    }

    if (event.is_final) {
        logging::info("Transcript",
                      {kv("session_id", session_id_),
                       kv("role", protocol_role(event.speaker)),
                       kv("sequence", event.sequence),
                       kv("text", event.text)});
    }

    for (const auto& subscriber : subscribers) {
        try {
            subscriber(event);
        } catch (const std::exception& ex) {
            logging::warn("Transcript subscriber failed",
                          {kv("session_id", session_id_), kv("error", ex.what())});
        }
    }
    return true;
}

uint64_t TranscriptEmitter::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_subscriber_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void TranscriptEmitter::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}

std::vector<TranscriptEvent> TranscriptEmitter::events_since(uint64_t after_sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TranscriptEvent> result;
    for (const auto& event : history_) {
        if (event.sequence > after_sequence) {
            result.push_back(event);
        }
    }
    return result;
}

uint64_t TranscriptEmitter::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

}
