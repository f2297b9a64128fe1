#include "voice_gateway/vad/processor.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "voice_gateway/vad/model.hpp"

namespace voice_gateway {
namespace vad {

StreamingVadProcessor::StreamingVadProcessor(std::shared_ptr<SpeechModel> model,
                                             float threshold,
                                             int min_speech_duration_ms,
                                             int min_silence_duration_ms,
                                             int speech_prob_window)
    : model_(std::move(model)),
      threshold_(threshold),
      window_size_samples_(model_ ? model_->window_size() : 512),
      sampling_rate_(model_ ? model_->sampling_rate() : 16000),
      speech_prob_window_(std::max(1, speech_prob_window)) {
    min_speech_samples_ = static_cast<int64_t>(sampling_rate_) * min_speech_duration_ms / 1000;
    min_silence_samples_ = static_cast<int64_t>(sampling_rate_) * min_silence_duration_ms / 1000;
    if (model_) {
        state_ = model_->initialize_state();
    }
}

void StreamingVadProcessor::set_on_speech_start(BoundaryCallback cb) {
    on_speech_start_ = std::move(cb);
}

void StreamingVadProcessor::set_on_speech_end(BoundaryCallback cb) {
    on_speech_end_ = std::move(cb);
}

void StreamingVadProcessor::process_samples(const std::vector<int16_t>& samples) {
    if (!model_ || samples.empty()) {
        return;
    }
    buffer_.reserve(buffer_.size() + samples.size());
    for (auto sample : samples) {
        buffer_.push_back(static_cast<float>(sample) / 32768.0f);
    }
    while (buffer_.size() >= window_size_samples_) {
        std::vector<float> window(buffer_.begin(), buffer_.begin() + window_size_samples_);
        buffer_.erase(buffer_.begin(), buffer_.begin() + window_size_samples_);
        process_window(window);
    }
}

void StreamingVadProcessor::reset() {
    buffer_.clear();
    prob_history_.clear();
    speech_run_ = 0;
    silence_run_ = 0;
    active_speech_ = false;
    if (model_) {
        state_ = model_->initialize_state();
    }
}

float StreamingVadProcessor::get_smoothed_prob(const std::vector<float>& window) {
    std::vector<float> normalized = window;
    float max_amp = 0.0f;
    for (auto val : normalized) {
        max_amp = std::max(max_amp, std::abs(val));
    }
    if (max_amp > 0.0f && (max_amp > 1.0f || max_amp < 0.01f)) {
        for (auto& val : normalized) {
            val /= max_amp;
        }
    }
    const float prob = model_->get_speech_prob(normalized, &state_);
    prob_history_.push_back(prob);
    if (prob_history_.size() > static_cast<size_t>(speech_prob_window_)) {
        prob_history_.pop_front();
    }
    if (prob_history_.size() <= 1) {
        return prob;
    }
    // Newer windows weigh more.
    float weighted_sum = 0.0f;
    float weight_total = 0.0f;
    int weight = 1;
    for (const auto val : prob_history_) {
        weighted_sum += val * static_cast<float>(weight);
        weight_total += static_cast<float>(weight);
        ++weight;
    }
    return weighted_sum / weight_total;
}

void StreamingVadProcessor::process_window(const std::vector<float>& window) {
    const bool is_speech = get_smoothed_prob(window) > threshold_;
    const auto length = static_cast<int64_t>(window.size());
    current_sample_ += length;

    if (is_speech) {
        speech_run_ += length;
        silence_run_ = 0;
        if (!active_speech_ && speech_run_ >= min_speech_samples_) {
            active_speech_ = true;
            if (on_speech_start_) {
                on_speech_start_(current_time_sec());
            }
        }
        return;
    }

    silence_run_ += length;
    if (!active_speech_) {
        speech_run_ = 0;
        return;
    }
    if (silence_run_ >= min_silence_samples_) {
        active_speech_ = false;
        speech_run_ = 0;
        if (on_speech_end_) {
            on_speech_end_(current_time_sec());
        }
    }
}

double StreamingVadProcessor::current_time_sec() const {
    return static_cast<double>(current_sample_) / static_cast<double>(sampling_rate_);
}

}
}
