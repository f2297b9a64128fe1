#include "voice_gateway/pipeline/utterance_aggregator.hpp"

#include <utility>

#include "voice_gateway/utils/text.hpp"

namespace voice_gateway {

namespace {

SpeakerRole other(SpeakerRole speaker) {
    return speaker == SpeakerRole::User ? SpeakerRole::Bot : SpeakerRole::User;
}

}

UtteranceAggregator::UtteranceAggregator(double min_confidence, UpdateListener listener)
    : min_confidence_(min_confidence), listener_(std::move(listener)) {}

bool UtteranceAggregator::accepts(const RecognitionIncrement& increment) const {
    return !utils::is_blank(increment.text) && increment.confidence >= min_confidence_;
}

bool UtteranceAggregator::apply(SpeakerRole speaker, const RecognitionIncrement& increment) {
    std::lock_guard<std::mutex> lock(mutex_);
    return apply_locked(speaker, increment);
}

bool UtteranceAggregator::apply_locked(SpeakerRole speaker,
                                       const RecognitionIncrement& increment) {
    auto& current = open_[slot(speaker)];
    if (!accepts(increment)) {
        // A dropped final increment still ends the utterance it belongs to.
        if (increment.is_final && current) {
            seal_locked(speaker);
            return true;
        }
        return false;
    }

    if (!current) {
        seal_locked(other(speaker));
        Utterance utterance;
        utterance.id = next_id_++;
        utterance.speaker = speaker;
        utterance.started_at = Clock::now();
        current = std::move(utterance);
    }
    current->increments.push_back(increment.text);
    if (increment.language) {
        current->language = increment.language;
    }
    if (increment.is_final) {
        seal_locked(speaker);
    } else if (listener_) {
        listener_(*current);
    }
    return true;
}

std::optional<Utterance> UtteranceAggregator::finalize(
    SpeakerRole speaker, const std::vector<RecognitionIncrement>& pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& last = last_final_[slot(speaker)];
    const uint64_t sealed_before = last ? last->id : 0;
    for (const auto& increment : pending) {
        apply_locked(speaker, increment);
    }
    if (open_[slot(speaker)]) {
        return seal_locked(speaker);
    }
    // An explicit final increment in `pending` may already have sealed it.
    if (last && last->id != sealed_before) {
        return last;
    }
    return std::nullopt;
}

std::optional<Utterance> UtteranceAggregator::seal_locked(SpeakerRole speaker) {
    auto& current = open_[slot(speaker)];
    if (!current) {
        return std::nullopt;
    }
    Utterance sealed = std::move(*current);
    current.reset();
    sealed.is_final = true;
    sealed.ended_at = Clock::now();
    last_final_[slot(speaker)] = sealed;
    if (listener_) {
        listener_(sealed);
    }
    return sealed;
}

std::optional<Utterance> UtteranceAggregator::open_utterance(SpeakerRole speaker) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_[slot(speaker)];
}

std::optional<Utterance> UtteranceAggregator::last_final(SpeakerRole speaker) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_final_[slot(speaker)];
}

void UtteranceAggregator::discard_open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_[0].reset();
    open_[1].reset();
}

}
