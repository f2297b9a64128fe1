#include "voice_gateway/audio/port.hpp"

#include <algorithm>
#include <cstring>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/sip/pj_thread.hpp"

namespace voice_gateway::audio {

AudioMediaPort::AudioMediaPort(size_t max_outbound_samples)
    : max_outbound_samples_(max_outbound_samples) {
    worker_ = std::thread([this]() { worker_loop(); });
}

AudioMediaPort::~AudioMediaPort() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_worker_ = true;
    }
    queue_cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AudioMediaPort::set_on_frame_received(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_frame_received_ = std::move(handler);
}

void AudioMediaPort::push_outbound(const std::vector<int16_t>& samples) {
    std::lock_guard<std::mutex> lock(outbound_mutex_);
    outbound_.insert(outbound_.end(), samples.begin(), samples.end());
    if (outbound_.size() > max_outbound_samples_) {
        const auto overflow = outbound_.size() - max_outbound_samples_;
        outbound_.erase(outbound_.begin(), outbound_.begin() + static_cast<long>(overflow));
        logging::debug("Outbound audio overflow", {kv("dropped_samples", overflow)});
    }
}

size_t AudioMediaPort::clear_outbound() {
    std::lock_guard<std::mutex> lock(outbound_mutex_);
    const auto dropped = outbound_.size();
    outbound_.clear();
    return dropped;
}

void AudioMediaPort::onFrameRequested(pj::MediaFrame& frame) {
    frame.type = PJMEDIA_FRAME_TYPE_AUDIO;
    std::lock_guard<std::mutex> lock(outbound_mutex_);
    if (outbound_.empty() || frame.size == 0) {
        frame.size = 0;
        frame.buf.clear();
        return;
    }
    const auto max_samples = static_cast<size_t>(frame.size / sizeof(int16_t));
    const auto copy_samples = std::min(max_samples, outbound_.size());
    std::vector<int16_t> samples(outbound_.begin(),
                                 outbound_.begin() + static_cast<long>(copy_samples));
    outbound_.erase(outbound_.begin(), outbound_.begin() + static_cast<long>(copy_samples));
    const auto copy_bytes = copy_samples * sizeof(int16_t);
    frame.buf.resize(copy_bytes);
    std::memcpy(frame.buf.data(), samples.data(), copy_bytes);
    frame.size = static_cast<unsigned>(copy_bytes);
}

void AudioMediaPort::onFrameReceived(pj::MediaFrame& frame) {
    if (frame.buf.empty() || frame.size == 0) {
        return;
    }
    const auto available_bytes = std::min(static_cast<size_t>(frame.size), frame.buf.size());
    const auto samples = available_bytes / sizeof(int16_t);
    std::vector<int16_t> audio_data(samples);
    std::memcpy(audio_data.data(), frame.buf.data(), samples * sizeof(int16_t));
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (inbound_.size() >= kMaxInboundFrames) {
            inbound_.pop_front();
        }
        inbound_.push_back(std::move(audio_data));
    }
    queue_cv_.notify_one();
}

void AudioMediaPort::worker_loop() {
    sip::ensure_pj_thread_registered("voicegw_audio");
    while (true) {
        std::vector<int16_t> data;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stop_worker_ || !inbound_.empty(); });
            if (stop_worker_ && inbound_.empty()) {
                break;
            }
            data = std::move(inbound_.front());
            inbound_.pop_front();
        }
        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = on_frame_received_;
        }
        if (!handler) {
            continue;
        }
        try {
            handler(std::move(data));
        } catch (const std::exception& ex) {
            logging::error("Inbound frame handler failed", {kv("error", ex.what())});
        }
    }
}

}
