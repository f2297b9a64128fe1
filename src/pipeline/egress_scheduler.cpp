#include "voice_gateway/pipeline/egress_scheduler.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/services/transport.hpp"

namespace voice_gateway {

EgressScheduler::EgressScheduler(std::string session_id,
                                 Transport& transport,
                                 size_t capacity,
                                 utils::CancellationToken session_token)
    : session_id_(std::move(session_id)),
      transport_(transport),
      stop_source_(session_token),
      queue_(capacity) {}

EgressScheduler::~EgressScheduler() {
    stop();
}

void EgressScheduler::set_turn_callbacks(TurnCallback on_first_frame, TurnCallback on_drained) {
    on_first_frame_ = std::move(on_first_frame);
    on_drained_ = std::move(on_drained);
}

void EgressScheduler::set_error_callback(ErrorCallback on_error) {
    on_error_ = std::move(on_error);
}

void EgressScheduler::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this]() { run(); });
}

void EgressScheduler::stop() {
    stop_source_.cancel();
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool EgressScheduler::push(uint64_t turn_id,
                           AudioFrame frame,
                           const utils::CancellationToken& token) {
    if (is_flushed(turn_id) || token.is_cancelled()) {
        return false;
    }
    return queue_.push(Entry{turn_id, std::move(frame)}, token);
}

void EgressScheduler::mark_turn_complete(uint64_t turn_id) {
    if (is_flushed(turn_id)) {
        return;
    }
    queue_.push(Entry{turn_id, std::nullopt}, stop_source_.token());
}

size_t EgressScheduler::flush(uint64_t turn_id) {
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        uint64_t current = flushed_through_.load();
        while (current < turn_id && !flushed_through_.compare_exchange_weak(current, turn_id)) {
        }
        transport_.flush();
    }
    const auto dropped = queue_.clear();
    logging::debug("Egress flushed",
                   {kv("session_id", session_id_), kv("turn_id", turn_id),
                    kv("dropped_frames", dropped)});
    return dropped;
}

void EgressScheduler::run() {
    const auto token = stop_source_.token();
    auto next_send = std::chrono::steady_clock::now();
    while (!token.is_cancelled()) {
        auto entry = queue_.pop(token);
        if (!entry) {
            break;
        }
        if (is_flushed(entry->turn_id)) {
            continue;
        }

        if (!entry->frame) {
            if (on_drained_) {
                on_drained_(entry->turn_id);
            }
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        if (entry->turn_id != started_turn_) {
            started_turn_ = entry->turn_id;
            next_send = now;
            if (on_first_frame_) {
                on_first_frame_(entry->turn_id);
            }
        } else if (next_send < now - std::chrono::milliseconds(100)) {
            // Fell behind; do not burst to catch up.
            next_send = now;
        }

        try {
            std::lock_guard<std::mutex> lock(send_mutex_);
            if (is_flushed(entry->turn_id)) {
                continue;
            }
            transport_.send_frame(*entry->frame);
            frames_sent_.fetch_add(1);
        } catch (const TransportLost& ex) {
            logging::warn("Transport lost while sending audio",
                          {kv("session_id", session_id_), kv("error", ex.what())});
            if (on_error_) {
                on_error_(ex.what());
            }
            break;
        }

        next_send += entry->frame->duration();
        const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
            next_send - std::chrono::steady_clock::now());
        if (wait.count() > 0 && token.wait_for(wait)) {
            break;
        }
    }
}

}
