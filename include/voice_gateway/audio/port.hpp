#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <pjsua2.hpp>

namespace voice_gateway::audio {

// Conference-bridge port of one call. Received frames are handed to the
// handler on a private worker so the media thread never blocks; outbound
// samples are buffered and played out as the bridge requests frames.
class AudioMediaPort : public pj::AudioMediaPort {
public:
    using FrameHandler = std::function<void(std::vector<int16_t>)>;

    explicit AudioMediaPort(size_t max_outbound_samples);
    ~AudioMediaPort() override;

    void set_on_frame_received(FrameHandler handler);

    void push_outbound(const std::vector<int16_t>& samples);
    // Returns the number of samples dropped.
    size_t clear_outbound();

    void onFrameRequested(pj::MediaFrame& frame) override;
    void onFrameReceived(pj::MediaFrame& frame) override;

private:
    void worker_loop();

    static constexpr size_t kMaxInboundFrames = 64;

    const size_t max_outbound_samples_;
    FrameHandler on_frame_received_;
    std::mutex handler_mutex_;

    std::mutex outbound_mutex_;
    std::deque<int16_t> outbound_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::vector<int16_t>> inbound_;
    std::thread worker_;
    bool stop_worker_{false};
};

}
