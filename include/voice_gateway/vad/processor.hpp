#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

namespace voice_gateway {
namespace vad {

class SpeechModel;

// Turns a PCM stream into speech start / stop boundaries. Speech must last
// min_speech_duration_ms to count as started and silence must last
// min_silence_duration_ms to count as stopped.
class StreamingVadProcessor {
public:
    using BoundaryCallback = std::function<void(double at_seconds)>;

    StreamingVadProcessor(std::shared_ptr<SpeechModel> model,
                          float threshold,
                          int min_speech_duration_ms,
                          int min_silence_duration_ms,
                          int speech_prob_window);

    void set_on_speech_start(BoundaryCallback cb);
    void set_on_speech_end(BoundaryCallback cb);

    void process_samples(const std::vector<int16_t>& samples);
    void reset();

    bool in_speech() const { return active_speech_; }

private:
    void process_window(const std::vector<float>& window);
    float get_smoothed_prob(const std::vector<float>& window);
    double current_time_sec() const;

    std::shared_ptr<SpeechModel> model_;
    float threshold_;
    size_t window_size_samples_;
    int sampling_rate_;
    int speech_prob_window_;
    int64_t min_speech_samples_;
    int64_t min_silence_samples_;

    std::vector<float> buffer_;
    std::deque<float> prob_history_;
    std::vector<float> state_;

    int64_t current_sample_ = 0;
    int64_t speech_run_ = 0;
    int64_t silence_run_ = 0;
    bool active_speech_ = false;

    BoundaryCallback on_speech_start_;
    BoundaryCallback on_speech_end_;
};

}
}
