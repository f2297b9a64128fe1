#include "voice_gateway/pipeline/synthesis_bridge.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/pipeline/egress_scheduler.hpp"

namespace voice_gateway {

namespace {

std::string base_language(const std::string& tag) {
    const auto dash = tag.find('-');
    return dash == std::string::npos ? tag : tag.substr(0, dash);
}

}

VoiceSelector::VoiceSelector(std::map<std::string, std::string> voices,
                             std::string default_language,
                             std::string session_language)
    : voices_(std::move(voices)),
      default_language_(std::move(default_language)),
      session_language_(std::move(session_language)) {}

void VoiceSelector::set_detected_language(const std::string& language) {
    if (language.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    detected_language_ = language;
}

std::optional<std::string> VoiceSelector::lookup(const std::string& language) const {
    const auto exact = voices_.find(language);
    if (exact != voices_.end()) {
        return exact->first;
    }
    // "de" or "de-AT" fall back to any voice of the same base language.
    const auto base = base_language(language);
    for (const auto& item : voices_) {
        if (base_language(item.first) == base) {
            return item.first;
        }
    }
    return std::nullopt;
}

VoiceSelection VoiceSelector::select() const {
    std::string wanted = session_language_;
    if (wanted == "auto") {
        std::lock_guard<std::mutex> lock(mutex_);
        wanted = detected_language_.empty() ? default_language_ : detected_language_;
    }
    auto language = lookup(wanted);
    if (!language) {
        language = lookup(default_language_);
    }
    if (!language) {
        return {"", wanted};
    }
    return {voices_.at(*language), *language};
}

SynthesisBridge::SynthesisBridge(std::string session_id,
                                 Options options,
                                 std::shared_ptr<SynthesisPool> pool,
                                 VoiceSelector& voices,
                                 EgressScheduler& egress,
                                 utils::CancellationToken session_token)
    : session_id_(std::move(session_id)),
      options_(options),
      frame_samples_(static_cast<size_t>(std::max(1, options.sample_rate * options.frame_ms / 1000))),
      pool_(std::move(pool)),
      voices_(voices),
      egress_(egress),
      stop_source_(session_token),
      jobs_(options.queue_capacity) {}

SynthesisBridge::~SynthesisBridge() {
    stop();
}

void SynthesisBridge::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this]() { run(); });
}

void SynthesisBridge::stop() {
    stop_source_.cancel();
    jobs_.close();
    {
        std::lock_guard<std::mutex> lock(unit_mutex_);
        if (unit_source_) {
            unit_source_->cancel();
        }
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SynthesisBridge::enqueue(uint64_t turn_id,
                              std::string text,
                              const utils::CancellationToken& token) {
    if (is_cancelled(turn_id)) {
        return false;
    }
    return jobs_.push(Job{turn_id, std::move(text)}, token);
}

void SynthesisBridge::finish_turn(uint64_t turn_id) {
    if (is_cancelled(turn_id)) {
        return;
    }
    jobs_.push(Job{turn_id, std::nullopt}, stop_source_.token());
}

void SynthesisBridge::cancel_turn(uint64_t turn_id) {
    uint64_t current = cancelled_through_.load();
    while (current < turn_id && !cancelled_through_.compare_exchange_weak(current, turn_id)) {
    }
    const auto dropped = jobs_.remove_if([turn_id](const Job& job) { return job.turn_id <= turn_id; });
    std::lock_guard<std::mutex> lock(unit_mutex_);
    if (unit_source_ && unit_turn_ <= turn_id) {
        unit_source_->cancel();
    }
    logging::debug("Synthesis cancelled",
                   {kv("session_id", session_id_), kv("turn_id", turn_id),
                    kv("dropped_units", dropped)});
}

void SynthesisBridge::run() {
    const auto token = stop_source_.token();
    while (!token.is_cancelled()) {
        auto job = jobs_.pop(token);
        if (!job) {
            break;
        }
        if (is_cancelled(job->turn_id)) {
            continue;
        }
        if (!job->text) {
            egress_.mark_turn_complete(job->turn_id);
            continue;
        }
        synthesize(job->turn_id, *job->text);
    }
}

void SynthesisBridge::synthesize(uint64_t turn_id, const std::string& text) {
    auto unit_source = std::make_shared<utils::CancellationSource>(stop_source_.token());
    {
        std::lock_guard<std::mutex> lock(unit_mutex_);
        unit_turn_ = turn_id;
        unit_source_ = unit_source;
    }
    // cancel_turn may have run between the pop and the registration above.
    if (is_cancelled(turn_id)) {
        unit_source->cancel();
    }
    const auto unit_token = unit_source->token();
    const auto selection = voices_.select();
    const auto started = std::chrono::steady_clock::now();
    bool first_chunk = true;

    try {
        auto lease = pool_->acquire(unit_token);
        lease->start(SynthesisRequest{text, selection.voice, selection.language,
                                      options_.sample_rate});
        std::vector<int16_t> pending;
        bool completed = true;
        while (true) {
            auto chunk = lease->next_increment(unit_token);
            if (!chunk) {
                completed = !unit_token.is_cancelled();
                break;
            }
            if (first_chunk) {
                first_chunk = false;
                const std::chrono::duration<double> elapsed =
                    std::chrono::steady_clock::now() - started;
                Metrics::instance().observe_latency("synthesize", elapsed.count());
                Metrics::instance().observe_latency_summary("synthesize", elapsed.count());
            }
            pending.insert(pending.end(), chunk->begin(), chunk->end());
            size_t offset = 0;
            while (pending.size() - offset >= frame_samples_) {
                std::vector<int16_t> samples(pending.begin() + offset,
                                             pending.begin() + offset + frame_samples_);
                offset += frame_samples_;
                if (!emit_frame(turn_id, std::move(samples), unit_token)) {
                    completed = false;
                    break;
                }
            }
            pending.erase(pending.begin(), pending.begin() + offset);
            if (!completed) {
                break;
            }
        }
        if (!completed) {
            lease->cancel();
        } else if (!pending.empty()) {
            pending.resize(frame_samples_, 0);
            emit_frame(turn_id, std::move(pending), unit_token);
        }
    } catch (const OperationCancelled&) {
        logging::debug("Synthesis unit cancelled",
                       {kv("session_id", session_id_), kv("turn_id", turn_id)});
    } catch (const std::exception& ex) {
        Metrics::instance().increment_event("synthesis_failure");
        logging::warn("Synthesis failed, skipping unit",
                      {kv("session_id", session_id_),
                       kv("turn_id", turn_id),
                       kv("voice", selection.voice),
                       kv("error", ex.what())});
    }

    std::lock_guard<std::mutex> lock(unit_mutex_);
    if (unit_source_ == unit_source) {
        unit_source_.reset();
    }
}

bool SynthesisBridge::emit_frame(uint64_t turn_id,
                                 std::vector<int16_t> samples,
                                 const utils::CancellationToken& token) {
    if (token.is_cancelled()) {
        return false;
    }
    AudioFrame frame;
    frame.sequence = ++frame_sequence_;
    frame.direction = Direction::Outbound;
    frame.sample_rate = options_.sample_rate;
    frame.samples = std::move(samples);
    return egress_.push(turn_id, std::move(frame), token);
}

}
