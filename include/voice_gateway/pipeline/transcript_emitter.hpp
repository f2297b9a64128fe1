#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "voice_gateway/session/types.hpp"

namespace voice_gateway {

// Turns utterance updates into ordered transcript events. Sequence numbers
// are session wide; nothing is emitted for an utterance after its final event.
class TranscriptEmitter {
public:
    using Subscriber = std::function<void(const TranscriptEvent&)>;

    TranscriptEmitter(std::string session_id, bool noise_filter, size_t history_size);

    // Returns true when an event was emitted.
    bool emit(const Utterance& utterance);

    // Subscribers are called in sequence order on the thread that produced
    // the update, while the session holds its turn and utterance locks. They
    // may read this emitter but must not call back into the session
    // (turn_state(), push_inbound(), stop()).
    uint64_t subscribe(Subscriber subscriber);
    void unsubscribe(uint64_t id);

    std::vector<TranscriptEvent> events_since(uint64_t after_sequence) const;
    uint64_t last_sequence() const;

    // Noise as seen by the client: user text of one or two digits.
    bool is_noise(const Utterance& utterance) const;

private:
    static size_t slot(SpeakerRole speaker) { return speaker == SpeakerRole::User ? 0 : 1; }

    std::string session_id_;
    bool noise_filter_;
    size_t history_size_;

    // Held across delivery so subscribers see events in sequence order.
    std::mutex delivery_mutex_;
    mutable std::mutex mutex_;
    uint64_t sequence_ = 0;
    std::array<uint64_t, 2> last_final_id_{{0, 0}};
    std::deque<TranscriptEvent> history_;
    std::map<uint64_t, Subscriber> subscribers_;
    uint64_t next_subscriber_ = 1;
};

}
