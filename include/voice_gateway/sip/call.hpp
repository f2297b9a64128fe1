#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <pjsua2.hpp>

#include "voice_gateway/audio/port.hpp"
#include "voice_gateway/services/transport.hpp"
#include "voice_gateway/session/types.hpp"

namespace voice_gateway {

class SipApp;

// One SIP call acting as the transport of one session. The session starts
// once media is up; hangup or media loss is reported back to the app.
class SipCall : public pj::Call,
                public Transport,
                public std::enable_shared_from_this<SipCall> {
public:
    SipCall(SipApp& app, pj::Account& account, int call_id = PJSUA_INVALID_ID);
    ~SipCall() override;

    void set_session_config(SessionConfig config);
    const SessionConfig& session_config() const;
    void set_session_id(const std::string& session_id);
    std::optional<std::string> session_id() const;

    bool is_closed() const { return closed_.load(); }

    void answer(int status_code);
    void hangup(int status_code);

    std::string id() const override;
    void send_frame(const AudioFrame& frame) override;
    void flush() override;
    void close() override;

    void onCallState(pj::OnCallStateParam& prm) override;
    void onCallMediaState(pj::OnCallMediaStateParam& prm) override;

private:
    void open_media();
    void close_media();
    void handle_audio_frame(std::vector<int16_t> samples);

    SipApp& app_;
    const std::string transport_id_;
    SessionConfig session_config_;
    mutable std::mutex session_mutex_;
    std::optional<std::string> session_id_;
    std::mutex media_mutex_;
    std::atomic<bool> media_active_{false};
    std::atomic<bool> closed_{false};
    uint64_t inbound_sequence_ = 0;
    std::unique_ptr<pj::AudioMedia> audio_media_;
    std::unique_ptr<audio::AudioMediaPort> media_port_;
};

}
