#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voice_gateway/session/types.hpp"

namespace voice_gateway {

// Accumulates recognition (user) and confirmed reply (bot) increments into
// utterances. Each speaker has a single slot, so a second open utterance for
// the same speaker cannot exist.
class UtteranceAggregator {
public:
    // Invoked under the aggregator lock after every change of an utterance.
    using UpdateListener = std::function<void(const Utterance&)>;

    UtteranceAggregator(double min_confidence, UpdateListener listener);

    // Returns false when the increment carried no usable text and sealed nothing.
    bool apply(SpeakerRole speaker, const RecognitionIncrement& increment);

    // Applies `pending` increments first, then seals whatever is still open.
    // Returns the sealed utterance, if there was one.
    std::optional<Utterance> finalize(SpeakerRole speaker,
                                      const std::vector<RecognitionIncrement>& pending = {});

    std::optional<Utterance> open_utterance(SpeakerRole speaker) const;
    std::optional<Utterance> last_final(SpeakerRole speaker) const;

    // Drops open utterances without notifying; used on teardown.
    void discard_open();

private:
    bool accepts(const RecognitionIncrement& increment) const;
    bool apply_locked(SpeakerRole speaker, const RecognitionIncrement& increment);
    std::optional<Utterance> seal_locked(SpeakerRole speaker);
    static size_t slot(SpeakerRole speaker) { return speaker == SpeakerRole::User ? 0 : 1; }

    double min_confidence_;
    UpdateListener listener_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::array<std::optional<Utterance>, 2> open_;
    std::array<std::optional<Utterance>, 2> last_final_;
};

}
