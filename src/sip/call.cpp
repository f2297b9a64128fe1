#include "voice_gateway/sip/call.hpp"

#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/session/session_manager.hpp"
#include "voice_gateway/sip/app.hpp"
#include "voice_gateway/sip/pj_thread.hpp"

namespace voice_gateway {

namespace {

std::string make_transport_id(int call_id) {
    static std::atomic<uint64_t> counter{0};
    return "sip-" + std::to_string(call_id) + "-" + std::to_string(++counter);
}

}

SipCall::SipCall(SipApp& app, pj::Account& account, int call_id)
    : pj::Call(account, call_id), app_(app), transport_id_(make_transport_id(call_id)) {}

SipCall::~SipCall() {
    // The last owner may be a session worker thread.
    sip::ensure_pj_thread_registered("voicegw_call");
    close_media();
}

void SipCall::set_session_config(SessionConfig config) {
    session_config_ = std::move(config);
}

const SessionConfig& SipCall::session_config() const {
    return session_config_;
}

void SipCall::set_session_id(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = session_id;
}

std::optional<std::string> SipCall::session_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

void SipCall::answer(int status_code) {
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::answer(prm);
}

void SipCall::hangup(int status_code) {
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::hangup(prm);
}

std::string SipCall::id() const {
    return transport_id_;
}

void SipCall::send_frame(const AudioFrame& frame) {
    if (closed_.load() || !media_active_.load()) {
        throw TransportLost("call media is not active");
    }
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (!media_port_) {
        throw TransportLost("call media port is gone");
    }
    media_port_->push_outbound(frame.samples);
}

void SipCall::flush() {
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (!media_port_) {
        return;
    }
    const auto dropped = media_port_->clear_outbound();
    if (dropped > 0) {
        logging::debug("Outbound audio flushed",
                       {kv("transport_id", transport_id_), kv("dropped_samples", dropped)});
    }
}

void SipCall::close() {
    if (closed_.exchange(true)) {
        return;
    }
    sip::ensure_pj_thread_registered("voicegw_close");
    try {
        if (isActive()) {
            hangup(PJSIP_SC_OK);
        }
    } catch (const pj::Error& err) {
        logging::warn("Hangup failed",
                      {kv("reason", err.reason),
                       kv("status", err.status),
                       kv("transport_id", transport_id_)});
    }
}

void SipCall::onCallState(pj::OnCallStateParam& prm) {
    (void)prm;
    try {
        const auto info = getInfo();
        logging::debug(
            "Call state changed",
            {kv("call_id", info.callIdString),
             kv("uri", info.remoteUri),
             kv("state", static_cast<int>(info.state)),
             kv("state_text", info.stateText),
             kv("session_id", session_id().value_or(""))});
        if (info.state == PJSIP_INV_STATE_CONFIRMED) {
            open_media();
        }
        if (info.state == PJSIP_INV_STATE_DISCONNECTED) {
            closed_.store(true);
            close_media();
            app_.handle_call_disconnected(getId(),
                                          "call disconnected: " + info.lastReason);
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Call state handler exception",
            {kv("error", ex.what())});
    }
}

void SipCall::onCallMediaState(pj::OnCallMediaStateParam& prm) {
    (void)prm;
    try {
        logging::debug(
            "Call media state changed",
            {kv("session_id", session_id().value_or(""))});
        if (!media_active_) {
            open_media();
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Call media handler exception",
            {kv("error", ex.what())});
    }
}

void SipCall::open_media() {
    {
        std::lock_guard<std::mutex> lock(media_mutex_);
        if (media_active_ || closed_) {
            return;
        }
        try {
            audio_media_ = std::make_unique<pj::AudioMedia>(getAudioMedia(-1));
        } catch (const pj::Error& ex) {
            logging::error(
                "Call media not available",
                {kv("reason", ex.reason),
                 kv("status", ex.status),
                 kv("transport_id", transport_id_)});
            return;
        }

        const auto& config = app_.config();
        pj::MediaFormatAudio format;
        format.type = PJMEDIA_TYPE_AUDIO;
        format.clockRate = static_cast<unsigned>(config.audio_sample_rate);
        format.channelCount = 1;
        format.bitsPerSample = 16;
        format.frameTimeUsec = static_cast<unsigned>(config.audio_frame_ms * 1000);

        media_port_ = std::make_unique<audio::AudioMediaPort>(
            static_cast<size_t>(config.audio_sample_rate));
        media_port_->createPort("port/" + transport_id_, format);
        media_port_->set_on_frame_received(
            [this](std::vector<int16_t> samples) { handle_audio_frame(std::move(samples)); });

        try {
            audio_media_->startTransmit(*media_port_);
            media_port_->startTransmit(*audio_media_);
        } catch (const pj::Error& ex) {
            logging::error("Failed to attach media port",
                           {kv("reason", ex.reason),
                            kv("status", ex.status),
                            kv("transport_id", transport_id_)});
            media_port_.reset();
            audio_media_.reset();
            return;
        }
        media_active_ = true;
    }
    app_.start_session(shared_from_this());
}

void SipCall::close_media() {
    std::unique_ptr<audio::AudioMediaPort> port;
    std::unique_ptr<pj::AudioMedia> media;
    {
        std::lock_guard<std::mutex> lock(media_mutex_);
        media_active_ = false;
        port = std::move(media_port_);
        media = std::move(audio_media_);
    }
    if (port && media) {
        try {
            media->stopTransmit(*port);
            port->stopTransmit(*media);
        } catch (const pj::Error& ex) {
            logging::debug("Media detach failed",
                           {kv("reason", ex.reason), kv("transport_id", transport_id_)});
        }
    }
}

void SipCall::handle_audio_frame(std::vector<int16_t> samples) {
    const auto id = session_id();
    if (!id || closed_.load()) {
        return;
    }
    AudioFrame frame;
    frame.sequence = ++inbound_sequence_;
    frame.direction = Direction::Inbound;
    frame.sample_rate = app_.config().audio_sample_rate;
    frame.samples = std::move(samples);
    app_.sessions().route_inbound_frame(*id, std::move(frame));
}

}
