#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "voice_gateway/services/connection_pool.hpp"
#include "voice_gateway/services/synthesis_client.hpp"
#include "voice_gateway/utils/bounded_queue.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

class EgressScheduler;

using SynthesisPool = ConnectionPool<SynthesisClient>;

struct VoiceSelection {
    std::string voice;
    std::string language;
};

// Picks the synthesis voice for a session. In auto mode the last detected
// language decides; unknown languages use the default one.
class VoiceSelector {
public:
    VoiceSelector(std::map<std::string, std::string> voices,
                  std::string default_language,
                  std::string session_language);

    void set_detected_language(const std::string& language);
    VoiceSelection select() const;

private:
    std::optional<std::string> lookup(const std::string& language) const;

    std::map<std::string, std::string> voices_;
    std::string default_language_;
    std::string session_language_;
    mutable std::mutex mutex_;
    std::string detected_language_;
};

// Synthesizes reply units of one session strictly in order on one worker and
// re-chunks the audio into fixed frames for the egress scheduler.
class SynthesisBridge {
public:
    struct Options {
        int sample_rate = 16000;
        int frame_ms = 20;
        size_t queue_capacity = 64;
    };

    SynthesisBridge(std::string session_id,
                    Options options,
                    std::shared_ptr<SynthesisPool> pool,
                    VoiceSelector& voices,
                    EgressScheduler& egress,
                    utils::CancellationToken session_token);
    ~SynthesisBridge();

    void start();
    void stop();

    // Blocks while the unit queue is full.
    bool enqueue(uint64_t turn_id, std::string text, const utils::CancellationToken& token);
    // Every unit of the turn has been enqueued.
    void finish_turn(uint64_t turn_id);
    // Drops queued units of the turn (and earlier ones) and stops the one in flight.
    void cancel_turn(uint64_t turn_id);

    size_t frame_samples() const { return frame_samples_; }

private:
    struct Job {
        uint64_t turn_id = 0;
        std::optional<std::string> text;
    };

    bool is_cancelled(uint64_t turn_id) const { return turn_id <= cancelled_through_.load(); }
    void run();
    void synthesize(uint64_t turn_id, const std::string& text);
    bool emit_frame(uint64_t turn_id, std::vector<int16_t> samples,
                    const utils::CancellationToken& token);

    std::string session_id_;
    Options options_;
    size_t frame_samples_;
    std::shared_ptr<SynthesisPool> pool_;
    VoiceSelector& voices_;
    EgressScheduler& egress_;
    utils::CancellationSource stop_source_;
    utils::BoundedQueue<Job> jobs_;
    std::atomic<uint64_t> cancelled_through_{0};
    uint64_t frame_sequence_ = 0;

    std::mutex unit_mutex_;
    uint64_t unit_turn_ = 0;
    std::shared_ptr<utils::CancellationSource> unit_source_;

    std::thread worker_;
};

}
