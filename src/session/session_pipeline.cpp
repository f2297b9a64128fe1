#include "voice_gateway/session/session_pipeline.hpp"

#include <exception>
#include <utility>

#include "voice_gateway/config.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/pipeline/response_streamer.hpp"
#include "voice_gateway/services/transport.hpp"
#include "voice_gateway/utils/text.hpp"
#include "voice_gateway/vad/model.hpp"
#include "voice_gateway/vad/processor.hpp"

namespace voice_gateway {

namespace {

constexpr std::chrono::milliseconds kEventPoll{100};

int64_t ticks(Clock::time_point at) {
    return at.time_since_epoch().count();
}

double seconds_since(Clock::time_point at) {
    const std::chrono::duration<double> elapsed = Clock::now() - at;
    return elapsed.count();
}

std::unique_ptr<vad::StreamingVadProcessor> make_vad(const std::shared_ptr<vad::SpeechModel>& model,
                                                     const PipelineSettings& settings) {
    if (!model) {
        return nullptr;
    }
    return std::make_unique<vad::StreamingVadProcessor>(model,
                                                        settings.vad_threshold,
                                                        settings.vad_min_speech_ms,
                                                        settings.vad_min_silence_ms,
                                                        settings.vad_prob_window);
}

}

PipelineSettings PipelineSettings::from_config(const Config& config) {
    PipelineSettings settings;
    settings.sample_rate = config.audio_sample_rate;
    settings.frame_ms = config.audio_frame_ms;
    settings.queue_capacity = static_cast<size_t>(config.pipeline_queue_capacity);
    settings.egress_queue_frames = static_cast<size_t>(config.egress_queue_frames);
    settings.min_confidence = config.recognition_min_confidence;
    settings.final_timeout = std::chrono::milliseconds(config.recognition_final_timeout_ms);
    settings.reopen_delay = std::chrono::milliseconds(config.recognition_reopen_delay_ms);
    settings.vad_threshold = static_cast<float>(config.vad_threshold);
    settings.vad_min_speech_ms = config.vad_min_speech_duration_ms;
    settings.vad_min_silence_ms = config.vad_min_silence_duration_ms;
    settings.vad_prob_window = config.vad_speech_prob_window;
    settings.voices = config.synthesis_voices;
    settings.synthesis_default_language = config.synthesis_default_language;
    settings.backend.connect_timeout = std::chrono::milliseconds(
        static_cast<int64_t>(config.backend_connect_timeout * 1000.0));
    settings.backend.first_token_timeout =
        std::chrono::milliseconds(config.backend_first_token_timeout_ms);
    settings.backend.idle_timeout = std::chrono::milliseconds(config.backend_idle_timeout_ms);
    settings.noise_filter = config.transcript_noise_filter;
    settings.history_size = static_cast<size_t>(config.transcript_history_size);
    settings.min_clause_chars = static_cast<size_t>(config.response_min_clause_chars);
    settings.max_unit_chars = static_cast<size_t>(config.response_max_unit_chars);
    settings.fallback_message = config.fallback_message;
    settings.interruptions_allowed = config.interruptions_are_allowed;
    return settings;
}

SessionPipeline::SessionPipeline(std::string session_id,
                                 SessionConfig config,
                                 PipelineSettings settings,
                                 PipelineServices services,
                                 std::shared_ptr<Transport> transport,
                                 FatalErrorHandler on_fatal)
    : session_id_(std::move(session_id)),
      config_(std::move(config)),
      settings_(std::move(settings)),
      services_(std::move(services)),
      transport_(std::move(transport)),
      on_fatal_(std::move(on_fatal)),
      last_activity_(ticks(Clock::now())),
      emitter_(session_id_, settings_.noise_filter, settings_.history_size),
      aggregator_(settings_.min_confidence,
                  [this](const Utterance& utterance) {
                      on_user_utterance(utterance);
                      emitter_.emit(utterance);
                  }),
      turn_(session_id_),
      voices_(settings_.voices, settings_.synthesis_default_language, config_.language),
      egress_(session_id_, *transport_, settings_.egress_queue_frames, session_source_.token()),
      synthesis_(session_id_,
                 SynthesisBridge::Options{settings_.sample_rate, settings_.frame_ms,
                                          settings_.queue_capacity},
                 services_.synthesis_pool,
                 voices_,
                 egress_,
                 session_source_.token()),
      dispatcher_(session_id_, services_.backend, settings_.backend),
      recognition_(session_id_,
                   RecognitionBridge::Options{config_.language, settings_.sample_rate,
                                              settings_.queue_capacity, settings_.reopen_delay},
                   services_.recognition_pool,
                   make_vad(services_.vad_model, settings_),
                   session_source_.token()) {
    turn_.set_transition_listener([this](TurnState from, TurnState to, uint64_t turn_id) {
        on_transition(from, to, turn_id);
    });

    TurnController::InterruptHandlers handlers;
    handlers.cancel_backend = [this](uint64_t) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (reply_source_) {
            reply_source_->cancel();
        }
        if (reply_streamer_) {
            reply_streamer_->cancel();
        }
        if (active_reply_) {
            active_reply_->cancel();
        }
    };
    handlers.discard_output = [this](uint64_t turn_id) {
        synthesis_.cancel_turn(turn_id);
        egress_.flush(turn_id);
    };
    handlers.finalize_bot_utterance = [this](uint64_t) {
        aggregator_.finalize(SpeakerRole::Bot);
    };
    turn_.set_interrupt_handlers(std::move(handlers));

    egress_.set_turn_callbacks(
        [this](uint64_t turn_id) { turn_.signal_bot_speech_start(turn_id); },
        [this](uint64_t turn_id) { turn_.signal_bot_speech_end(turn_id); });
    egress_.set_error_callback([this](const std::string& message) {
        fail("transport lost: " + message);
    });
}

SessionPipeline::~SessionPipeline() {
    stop();
}

void SessionPipeline::start() {
    if (started_.exchange(true)) {
        return;
    }
    egress_.start();
    synthesis_.start();
    recognition_.start();
    conversation_thread_ = std::thread([this]() { run_conversation(); });
    logging::info("Session pipeline started",
                  {kv("session_id", session_id_),
                   kv("transport_id", transport_->id()),
                   kv("agent", config_.agent),
                   kv("language", config_.language)});
}

void SessionPipeline::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    session_source_.cancel();
    turn_.close();
    recognition_.stop();
    if (conversation_thread_.joinable()) {
        conversation_thread_.join();
    }
    join_reply();
    synthesis_.stop();
    egress_.stop();
    dispatcher_.release_bindings();
    aggregator_.discard_open();
    logging::info("Session pipeline stopped", {kv("session_id", session_id_)});
}

bool SessionPipeline::push_inbound(AudioFrame frame) {
    if (stopped_.load()) {
        return false;
    }
    return recognition_.push_frame(std::move(frame));
}

Clock::time_point SessionPipeline::last_activity() const {
    return Clock::time_point(Clock::duration(last_activity_.load()));
}

void SessionPipeline::touch() {
    last_activity_.store(ticks(Clock::now()));
}

void SessionPipeline::fail(const std::string& reason) {
    if (stopped_.load() || failed_.exchange(true)) {
        return;
    }
    Metrics::instance().increment_event("session_failure");
    logging::error("Session pipeline failed",
                   {kv("session_id", session_id_), kv("reason", reason)});
    if (on_fatal_) {
        on_fatal_(reason);
    }
}

void SessionPipeline::run_conversation() {
    const auto token = session_source_.token();
    while (!token.is_cancelled()) {
        try {
            auto event = recognition_.next_event_for(kEventPoll, token);
            if (event) {
                touch();
                handle_event(*event);
            } else if (recognition_.closed()) {
                break;
            }
            check_final_timeout();
        } catch (const std::exception& ex) {
            fail(ex.what());
            break;
        }
    }
}

void SessionPipeline::handle_event(const RecognitionEvent& event) {
    switch (event.kind) {
        case RecognitionEvent::Kind::SpeechStarted:
            on_speech_started();
            break;
        case RecognitionEvent::Kind::SpeechStopped:
            on_speech_stopped();
            break;
        case RecognitionEvent::Kind::Text:
            on_text(event.increment);
            break;
        case RecognitionEvent::Kind::Failure:
            on_recognition_failure(event.error);
            break;
    }
}

bool SessionPipeline::barge_in() {
    if (!settings_.interruptions_allowed) {
        logging::debug("Interruptions disabled, ignoring user speech",
                       {kv("session_id", session_id_)});
        return false;
    }
    return turn_.request_interrupt();
}

void SessionPipeline::on_speech_started() {
    speech_active_ = true;
    final_deadline_.reset();
    switch (turn_.state()) {
        case TurnState::Idle:
            turn_.signal_user_speech_start();
            break;
        case TurnState::Dispatched:
        case TurnState::BotSpeaking:
            barge_in();
            break;
        default:
            break;
    }
}

void SessionPipeline::on_speech_stopped() {
    speech_active_ = false;
    speech_stopped_at_ = Clock::now();
    if (turn_.state() != TurnState::UserSpeaking) {
        return;
    }
    bool have_final = false;
    {
        std::lock_guard<std::mutex> lock(user_mutex_);
        have_final = !turn_utterances_.empty();
    }
    if (have_final && !aggregator_.open_utterance(SpeakerRole::User)) {
        complete_user_turn();
        return;
    }
    // The recogniser usually delivers the final text a little after silence.
    final_deadline_ = Clock::now() + settings_.final_timeout;
}

void SessionPipeline::on_text(const RecognitionIncrement& increment) {
    if (increment.language && !increment.language->empty()) {
        voices_.set_detected_language(*increment.language);
    }
    const bool usable = !utils::is_blank(increment.text) &&
                        increment.confidence >= settings_.min_confidence;
    switch (turn_.state()) {
        case TurnState::Closing:
            return;
        case TurnState::Idle:
            if (!usable) {
                return;
            }
            turn_.signal_user_speech_start();
            break;
        case TurnState::Dispatched:
        case TurnState::BotSpeaking:
            if (!usable ||
                (settings_.noise_filter && utils::is_recognition_noise(increment.text))) {
                return;
            }
            if (!barge_in()) {
                return;
            }
            break;
        case TurnState::UserSpeaking:
            break;
    }

    aggregator_.apply(SpeakerRole::User, increment);
    if (increment.is_final && !speech_active_) {
        complete_user_turn();
    }
}

void SessionPipeline::on_recognition_failure(const std::string& error) {
    final_deadline_.reset();
    if (turn_.state() != TurnState::UserSpeaking) {
        logging::debug("Recognition failure outside user turn",
                       {kv("session_id", session_id_), kv("error", error)});
        return;
    }
    logging::warn("Recognition failed, closing user turn",
                  {kv("session_id", session_id_), kv("error", error)});
    aggregator_.finalize(SpeakerRole::User);
    turn_.abandon_user_turn();
}

void SessionPipeline::check_final_timeout() {
    if (!final_deadline_ || Clock::now() < *final_deadline_) {
        return;
    }
    final_deadline_.reset();
    if (turn_.state() == TurnState::UserSpeaking) {
        logging::debug("No final transcript after silence, closing user turn",
                       {kv("session_id", session_id_)});
        complete_user_turn();
    }
}

void SessionPipeline::on_user_utterance(const Utterance& utterance) {
    if (utterance.speaker != SpeakerRole::User || !utterance.is_final) {
        return;
    }
    std::lock_guard<std::mutex> lock(user_mutex_);
    turn_utterances_.push_back(utterance);
}

void SessionPipeline::complete_user_turn() {
    final_deadline_.reset();
    if (turn_.state() != TurnState::UserSpeaking) {
        return;
    }
    aggregator_.finalize(SpeakerRole::User);

    std::vector<Utterance> utterances;
    {
        std::lock_guard<std::mutex> lock(user_mutex_);
        utterances = turn_utterances_;
    }
    Utterance request;
    for (const auto& utterance : utterances) {
        const auto text = utils::trim(utterance.text());
        if (text.empty() || (settings_.noise_filter && utils::is_recognition_noise(text))) {
            continue;
        }
        if (request.increments.empty()) {
            request = utterance;
            request.increments.clear();
            request.increments.push_back(text);
        } else {
            request.increments.push_back(" " + text);
            request.language = utterance.language ? utterance.language : request.language;
            request.ended_at = utterance.ended_at;
        }
    }
    if (request.increments.empty()) {
        logging::debug("Nothing to answer, abandoning user turn", {kv("session_id", session_id_)});
        turn_.abandon_user_turn();
        return;
    }

    const auto turn_id = turn_.signal_user_speech_end();
    if (!turn_id) {
        return;
    }
    if (ticks(speech_stopped_at_) != 0) {
        const auto elapsed = seconds_since(speech_stopped_at_);
        Metrics::instance().observe_latency("recognize", elapsed);
        Metrics::instance().observe_latency_summary("recognize", elapsed);
        speech_stopped_at_ = Clock::time_point{};
    }
    start_reply(*turn_id, std::move(request));
}

void SessionPipeline::start_reply(uint64_t turn_id, Utterance utterance) {
    join_reply();
    auto source = std::make_shared<utils::CancellationSource>(session_source_.token());
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        reply_source_ = source;
    }
    reply_thread_ = std::thread(
        [this, turn_id, utterance = std::move(utterance), token = source->token()]() {
            run_reply(turn_id, utterance, token);
        });
}

void SessionPipeline::join_reply() {
    if (reply_thread_.joinable()) {
        reply_thread_.join();
    }
}

void SessionPipeline::run_reply(uint64_t turn_id,
                                Utterance utterance,
                                utils::CancellationToken token) {
    auto streamer = std::make_shared<ResponseStreamer>(
        settings_.min_clause_chars, settings_.max_unit_chars,
        [this, turn_id, token](const std::string& unit) { forward_unit(turn_id, unit, token); });
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        reply_streamer_ = streamer;
        if (token.is_cancelled()) {
            streamer->cancel();
        }
    }

    bool failed = false;
    std::unique_ptr<DispatchedReply> reply;
    try {
        reply = dispatcher_.dispatch(config_, utterance, token);
        {
            std::lock_guard<std::mutex> lock(output_mutex_);
            active_reply_ = reply.get();
        }
        while (auto delta = reply->next_increment(token)) {
            streamer->feed(*delta);
        }
        if (!token.is_cancelled()) {
            streamer->finish();
        }
    } catch (const BackendUnavailable& ex) {
        failed = true;
        logging::warn("Backend unavailable",
                      {kv("session_id", session_id_),
                       kv("turn_id", turn_id),
                       kv("forwarded_units", streamer->units_forwarded()),
                       kv("error", ex.what())});
    } catch (const std::exception& ex) {
        failed = true;
        logging::error("Reply failed",
                       {kv("session_id", session_id_),
                        kv("turn_id", turn_id),
                        kv("error", ex.what())});
    }

    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        active_reply_ = nullptr;
        if (reply_streamer_ == streamer) {
            reply_streamer_.reset();
        }
    }
    if (token.is_cancelled()) {
        return;
    }
    // A reply cut short after some units were spoken ends where it stopped.
    if (failed && streamer->units_forwarded() == 0) {
        speak_fallback(turn_id, token);
    }
    synthesis_.finish_turn(turn_id);
}

void SessionPipeline::forward_unit(uint64_t turn_id,
                                   const std::string& unit,
                                   const utils::CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (token.is_cancelled()) {
            return;
        }
        RecognitionIncrement increment;
        increment.text = aggregator_.open_utterance(SpeakerRole::Bot) ? " " + unit : unit;
        increment.language = voices_.select().language;
        aggregator_.apply(SpeakerRole::Bot, increment);
    }
    synthesis_.enqueue(turn_id, unit, token);
}

void SessionPipeline::speak_fallback(uint64_t turn_id, const utils::CancellationToken& token) {
    const auto text = utils::trim(settings_.fallback_message);
    if (text.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (token.is_cancelled()) {
            return;
        }
        RecognitionIncrement increment;
        increment.text = text;
        increment.is_final = true;
        increment.language = voices_.select().language;
        aggregator_.apply(SpeakerRole::Bot, increment);
    }
    Metrics::instance().increment_event("fallback");
    synthesis_.enqueue(turn_id, text, token);
}

void SessionPipeline::on_transition(TurnState from, TurnState to, uint64_t turn_id) {
    touch();
    if (to != TurnState::Closing) {
        if (const auto loser = speaker_losing_turn(from, to)) {
            aggregator_.finalize(*loser);
        }
    }
    switch (to) {
        case TurnState::UserSpeaking: {
            std::lock_guard<std::mutex> lock(user_mutex_);
            turn_utterances_.clear();
            break;
        }
        case TurnState::Dispatched:
            dispatched_at_.store(ticks(Clock::now()));
            break;
        case TurnState::BotSpeaking: {
            const auto elapsed =
                seconds_since(Clock::time_point(Clock::duration(dispatched_at_.load())));
            Metrics::instance().observe_latency("first_audio", elapsed);
            Metrics::instance().observe_latency_summary("first_audio", elapsed);
            logging::debug("Bot speaking",
                           {kv("session_id", session_id_), kv("turn_id", turn_id),
                            kv("first_audio_s", elapsed)});
            break;
        }
        default:
            break;
    }
}

}
