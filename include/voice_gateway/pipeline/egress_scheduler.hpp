#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "voice_gateway/session/types.hpp"
#include "voice_gateway/utils/bounded_queue.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

class Transport;

// Paces outbound frames onto the transport at their playback rate. A full
// queue blocks the producer. flush(turn) drops everything queued and rejects
// any later frame of that turn or an earlier one, including audio the
// transport still buffers.
class EgressScheduler {
public:
    using TurnCallback = std::function<void(uint64_t turn_id)>;
    using ErrorCallback = std::function<void(const std::string& message)>;

    EgressScheduler(std::string session_id,
                    Transport& transport,
                    size_t capacity,
                    utils::CancellationToken session_token);
    ~EgressScheduler();

    // First frame of a turn reached the transport / a completed turn drained.
    void set_turn_callbacks(TurnCallback on_first_frame, TurnCallback on_drained);
    void set_error_callback(ErrorCallback on_error);

    void start();
    void stop();

    bool push(uint64_t turn_id, AudioFrame frame, const utils::CancellationToken& token);
    // No more frames will follow for the turn.
    void mark_turn_complete(uint64_t turn_id);
    size_t flush(uint64_t turn_id);

    size_t queued() const { return queue_.size(); }
    uint64_t frames_sent() const { return frames_sent_.load(); }

private:
    struct Entry {
        uint64_t turn_id = 0;
        std::optional<AudioFrame> frame;
    };

    bool is_flushed(uint64_t turn_id) const { return turn_id <= flushed_through_.load(); }
    void run();

    std::string session_id_;
    Transport& transport_;
    // Orders the flushed check of a frame with its send.
    std::mutex send_mutex_;
    utils::CancellationSource stop_source_;
    utils::BoundedQueue<Entry> queue_;
    std::atomic<uint64_t> flushed_through_{0};
    std::atomic<uint64_t> frames_sent_{0};
    uint64_t started_turn_ = 0;
    TurnCallback on_first_frame_;
    TurnCallback on_drained_;
    ErrorCallback on_error_;
    std::thread worker_;
};

}
