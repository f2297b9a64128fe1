#include "voice_gateway/pipeline/recognition_bridge.hpp"

#include <exception>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/vad/processor.hpp"

namespace voice_gateway {

RecognitionBridge::RecognitionBridge(std::string session_id,
                                     Options options,
                                     std::shared_ptr<RecognitionPool> pool,
                                     std::unique_ptr<vad::StreamingVadProcessor> vad,
                                     utils::CancellationToken session_token)
    : session_id_(std::move(session_id)),
      options_(std::move(options)),
      pool_(std::move(pool)),
      vad_(std::move(vad)),
      stop_source_(session_token),
      ingress_(options_.queue_capacity),
      events_(options_.queue_capacity) {
    if (vad_) {
        vad_->set_on_speech_start([this](double) { publish(RecognitionEvent::speech_started()); });
        vad_->set_on_speech_end([this](double) { publish(RecognitionEvent::speech_stopped()); });
    }
}

RecognitionBridge::~RecognitionBridge() {
    stop();
}

void RecognitionBridge::start() {
    if (ingress_thread_.joinable()) {
        return;
    }
    ingress_thread_ = std::thread([this]() { run_ingress(); });
    reader_thread_ = std::thread([this]() { run_reader(); });
}

void RecognitionBridge::stop() {
    stop_source_.cancel();
    ingress_.close();
    events_.close();
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream = std::move(stream_);
        stream_.reset();
        stream_cv_.notify_all();
    }
    if (stream) {
        stream->lease->cancel();
    }
    if (ingress_thread_.joinable()) {
        ingress_thread_.join();
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

bool RecognitionBridge::push_frame(AudioFrame frame) {
    return ingress_.push(std::move(frame), stop_source_.token());
}

std::optional<RecognitionEvent> RecognitionBridge::next_event(const utils::CancellationToken& token) {
    auto event = events_.pop(token);
    if (!event || token.is_cancelled()) {
        return std::nullopt;
    }
    return event;
}

std::optional<RecognitionEvent> RecognitionBridge::next_event_for(
    std::chrono::milliseconds timeout, const utils::CancellationToken& token) {
    auto event = events_.pop_for(timeout, token);
    if (!event || token.is_cancelled()) {
        return std::nullopt;
    }
    return event;
}

void RecognitionBridge::cancel() {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (stream_) {
            generation = stream_->generation;
        }
    }
    if (generation != 0) {
        close_stream(generation, std::nullopt);
    }
    events_.clear();
}

bool RecognitionBridge::stream_open() const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    return static_cast<bool>(stream_);
}

void RecognitionBridge::publish(RecognitionEvent event) {
    events_.push(std::move(event), stop_source_.token());
}

bool RecognitionBridge::ensure_stream() {
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (stream_) {
            return true;
        }
        if (Clock::now() < reopen_after_) {
            if (!logged_drop_) {
                logged_drop_ = true;
                logging::debug("Recognition stream down, dropping audio",
                               {kv("session_id", session_id_)});
            }
            return false;
        }
    }

    const auto token = stop_source_.token();
    try {
        auto lease = pool_->acquire(token);
        lease->start(options_.language, options_.sample_rate);
        auto stream = std::make_shared<Stream>();
        stream->lease = std::move(lease);
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream->generation = next_generation_++;
        stream_ = std::move(stream);
        logged_drop_ = false;
        stream_cv_.notify_all();
        logging::debug("Recognition stream opened",
                       {kv("session_id", session_id_),
                        kv("generation", stream_->generation),
                        kv("language", options_.language)});
        return true;
    } catch (const OperationCancelled&) {
        return false;
    } catch (const PoolTimeout& ex) {
        fail_open(ex.what());
    } catch (const RecognitionFailure& ex) {
        fail_open(ex.what());
    }
    return false;
}

void RecognitionBridge::fail_open(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        reopen_after_ = Clock::now() + options_.reopen_delay;
    }
    Metrics::instance().increment_event("recognition_failure");
    logging::warn("Recognition stream could not be opened",
                  {kv("session_id", session_id_), kv("error", message)});
    publish(RecognitionEvent::failure(message));
}

void RecognitionBridge::close_stream(uint64_t generation,
                                     const std::optional<std::string>& error) {
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (!stream_ || stream_->generation != generation) {
            return;
        }
        stream = std::move(stream_);
        stream_.reset();
        if (error) {
            reopen_after_ = Clock::now() + options_.reopen_delay;
        }
    }
    stream->lease->cancel();
    if (error) {
        stream->broken = true;
        Metrics::instance().increment_event("recognition_failure");
        logging::warn("Recognition stream failed",
                      {kv("session_id", session_id_),
                       kv("generation", generation),
                       kv("error", *error)});
        publish(RecognitionEvent::failure(*error));
    }
}

void RecognitionBridge::run_ingress() {
    const auto token = stop_source_.token();
    while (auto frame = ingress_.pop(token)) {
        if (vad_) {
            vad_->process_samples(frame->samples);
        }
        if (!ensure_stream()) {
            continue;
        }
        std::shared_ptr<Stream> stream;
        {
            std::lock_guard<std::mutex> lock(stream_mutex_);
            stream = stream_;
        }
        if (!stream) {
            continue;
        }
        try {
            stream->lease->send_audio(*frame);
        } catch (const RecognitionFailure& ex) {
            close_stream(stream->generation, std::string(ex.what()));
        }
    }
}

void RecognitionBridge::run_reader() {
    const auto token = stop_source_.token();
    auto wake = token.on_cancel([this]() {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_cv_.notify_all();
    });

    while (!token.is_cancelled()) {
        std::shared_ptr<Stream> stream;
        {
            std::unique_lock<std::mutex> lock(stream_mutex_);
            stream_cv_.wait(lock, [&] { return token.is_cancelled() || stream_; });
            if (token.is_cancelled()) {
                break;
            }
            stream = stream_;
        }

        try {
            auto event = stream->lease->next_increment(token);
            if (!event) {
                if (!token.is_cancelled()) {
                    close_stream(stream->generation, std::nullopt);
                }
                continue;
            }
            if (event->kind == RecognitionEvent::Kind::Failure) {
                close_stream(stream->generation, event->error);
                continue;
            }
            publish(std::move(*event));
        } catch (const RecognitionFailure& ex) {
            close_stream(stream->generation, std::string(ex.what()));
        }
    }
}

}
