#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "voice_gateway/pipeline/backend_dispatcher.hpp"
#include "voice_gateway/pipeline/egress_scheduler.hpp"
#include "voice_gateway/pipeline/recognition_bridge.hpp"
#include "voice_gateway/pipeline/synthesis_bridge.hpp"
#include "voice_gateway/pipeline/transcript_emitter.hpp"
#include "voice_gateway/pipeline/turn_controller.hpp"
#include "voice_gateway/pipeline/utterance_aggregator.hpp"
#include "voice_gateway/session/types.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

struct Config;
class Transport;
class DispatchedReply;
class ResponseStreamer;

namespace vad {
class SpeechModel;
}

// Tunables of one session pipeline, normally taken from Config.
struct PipelineSettings {
    int sample_rate = 16000;
    int frame_ms = 20;
    size_t queue_capacity = 64;
    size_t egress_queue_frames = 50;

    double min_confidence = 0.0;
    std::chrono::milliseconds final_timeout{1000};
    std::chrono::milliseconds reopen_delay{500};

    float vad_threshold = 0.5f;
    int vad_min_speech_ms = 300;
    int vad_min_silence_ms = 1500;
    int vad_prob_window = 3;

    std::map<std::string, std::string> voices;
    std::string synthesis_default_language = "en-US";

    BackendDispatcher::Options backend;

    bool noise_filter = true;
    size_t history_size = 512;
    size_t min_clause_chars = 40;
    size_t max_unit_chars = 220;
    std::string fallback_message;
    bool interruptions_allowed = true;

    static PipelineSettings from_config(const Config& config);
};

// Shared, process-wide collaborators handed to every pipeline.
struct PipelineServices {
    std::shared_ptr<RecognitionPool> recognition_pool;
    std::shared_ptr<SynthesisPool> synthesis_pool;
    std::shared_ptr<ChatBackend> backend;
    // Optional; without it only the recognition service marks speech.
    std::shared_ptr<vad::SpeechModel> vad_model;
};

// All per-session state: turn control, recognition, dispatch, synthesis and
// egress for one transport. Nothing here is shared with other sessions
// except the pools inside PipelineServices.
class SessionPipeline {
public:
    using FatalErrorHandler = std::function<void(const std::string& reason)>;

    SessionPipeline(std::string session_id,
                    SessionConfig config,
                    PipelineSettings settings,
                    PipelineServices services,
                    std::shared_ptr<Transport> transport,
                    FatalErrorHandler on_fatal);
    ~SessionPipeline();

    SessionPipeline(const SessionPipeline&) = delete;
    SessionPipeline& operator=(const SessionPipeline&) = delete;

    void start();
    // Cancels every in-flight operation and joins the pipeline threads.
    void stop();

    // Blocks while the ingress queue is full; false once stopped.
    bool push_inbound(AudioFrame frame);

    const std::string& id() const { return session_id_; }
    const SessionConfig& config() const { return config_; }
    const std::shared_ptr<Transport>& transport() const { return transport_; }

    TurnState turn_state() const { return turn_.state(); }
    Clock::time_point last_activity() const;

    TranscriptEmitter& transcript() { return emitter_; }
    const BackendRoutingTable& routing_table() { return dispatcher_.routing_table(); }

private:
    void run_conversation();
    void handle_event(const RecognitionEvent& event);
    void on_speech_started();
    void on_speech_stopped();
    void on_text(const RecognitionIncrement& increment);
    void on_recognition_failure(const std::string& error);
    void check_final_timeout();
    // Hands the user turn over to the backend, or abandons it when nothing
    // worth answering was said.
    void complete_user_turn();
    bool barge_in();

    void start_reply(uint64_t turn_id, Utterance utterance);
    void join_reply();
    void run_reply(uint64_t turn_id, Utterance utterance, utils::CancellationToken token);
    void forward_unit(uint64_t turn_id, const std::string& unit,
                      const utils::CancellationToken& token);
    void speak_fallback(uint64_t turn_id, const utils::CancellationToken& token);

    void on_transition(TurnState from, TurnState to, uint64_t turn_id);
    void on_user_utterance(const Utterance& utterance);
    void touch();
    void fail(const std::string& reason);

    std::string session_id_;
    SessionConfig config_;
    PipelineSettings settings_;
    PipelineServices services_;
    std::shared_ptr<Transport> transport_;
    FatalErrorHandler on_fatal_;

    utils::CancellationSource session_source_;
    std::atomic<int64_t> last_activity_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> failed_{false};

    TranscriptEmitter emitter_;
    UtteranceAggregator aggregator_;
    TurnController turn_;
    VoiceSelector voices_;
    EgressScheduler egress_;
    SynthesisBridge synthesis_;
    BackendDispatcher dispatcher_;
    RecognitionBridge recognition_;

    // Conversation loop state; touched only by the conversation thread,
    // except `turn_utterances_` which the aggregator listener fills.
    bool speech_active_ = false;
    std::optional<Clock::time_point> final_deadline_;
    Clock::time_point speech_stopped_at_{};
    std::mutex user_mutex_;
    std::vector<Utterance> turn_utterances_;

    // Reply of the current bot turn. Units are forwarded under output_mutex_
    // so an interrupt never races a half-forwarded unit.
    std::mutex output_mutex_;
    std::shared_ptr<utils::CancellationSource> reply_source_;
    std::shared_ptr<ResponseStreamer> reply_streamer_;
    DispatchedReply* active_reply_ = nullptr;
    std::thread reply_thread_;
    std::atomic<int64_t> dispatched_at_{0};

    std::thread conversation_thread_;
};

}
