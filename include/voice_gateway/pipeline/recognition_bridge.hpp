#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "voice_gateway/services/connection_pool.hpp"
#include "voice_gateway/services/recognition_client.hpp"
#include "voice_gateway/session/types.hpp"
#include "voice_gateway/utils/bounded_queue.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

namespace vad {
class StreamingVadProcessor;
}

using RecognitionPool = ConnectionPool<RecognitionClient>;

// Feeds inbound audio to a pooled recognition stream and merges its results
// with local voice activity into one ordered event sequence. A failing stream
// is reported once as a Failure event and reopened for the next utterance.
class RecognitionBridge {
public:
    struct Options {
        std::string language = "auto";
        int sample_rate = 16000;
        size_t queue_capacity = 64;
        std::chrono::milliseconds reopen_delay{500};
    };

    RecognitionBridge(std::string session_id,
                      Options options,
                      std::shared_ptr<RecognitionPool> pool,
                      std::unique_ptr<vad::StreamingVadProcessor> vad,
                      utils::CancellationToken session_token);
    ~RecognitionBridge();

    void start();
    void stop();

    // Blocks while the ingress queue is full.
    bool push_frame(AudioFrame frame);
    // Next event in arrival order; nullopt after cancellation or stop().
    std::optional<RecognitionEvent> next_event(const utils::CancellationToken& token);
    // Like next_event() but gives up after `timeout`; see closed().
    std::optional<RecognitionEvent> next_event_for(std::chrono::milliseconds timeout,
                                                   const utils::CancellationToken& token);
    bool closed() const { return events_.closed(); }
    // Cancels the stream in flight and drops undelivered events.
    void cancel();

    bool stream_open() const;

private:
    struct Stream {
        RecognitionPool::Lease lease;
        uint64_t generation = 0;
        std::atomic<bool> broken{false};

        ~Stream() {
            if (broken.load()) {
                lease.invalidate();
            }
        }
    };

    void run_ingress();
    void run_reader();
    bool ensure_stream();
    // Retires the stream of `generation`; publishes a Failure when `error` is set.
    void close_stream(uint64_t generation, const std::optional<std::string>& error);
    void fail_open(const std::string& message);
    void publish(RecognitionEvent event);

    std::string session_id_;
    Options options_;
    std::shared_ptr<RecognitionPool> pool_;
    std::unique_ptr<vad::StreamingVadProcessor> vad_;
    utils::CancellationSource stop_source_;

    utils::BoundedQueue<AudioFrame> ingress_;
    utils::BoundedQueue<RecognitionEvent> events_;

    mutable std::mutex stream_mutex_;
    std::condition_variable stream_cv_;
    std::shared_ptr<Stream> stream_;
    uint64_t next_generation_ = 1;
    Clock::time_point reopen_after_{};
    bool logged_drop_ = false;

    std::thread ingress_thread_;
    std::thread reader_thread_;
};

}
