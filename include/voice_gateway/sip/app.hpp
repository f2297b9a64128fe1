#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <pjsua2.hpp>

#include "voice_gateway/config.hpp"
#include "voice_gateway/session/types.hpp"

namespace voice_gateway {

class SessionManager;
class SipAccount;
class SipCall;

// PJSUA2 endpoint and account. Every answered call becomes the transport of
// one session in the SessionManager.
class SipApp {
public:
    SipApp(Config config, SessionManager& sessions);
    ~SipApp();

    void init();
    // Polls PJSIP until request_stop(); must run on the thread that called init().
    void run();
    // Async-signal-safe.
    void request_stop();
    void stop();

    const Config& config() const;
    SessionManager& sessions();

private:
    friend class SipAccount;
    friend class SipCall;

    void init_pjsip();
    void shutdown_pjsip();
    int handle_events();
    void handle_incoming_call(pj::OnIncomingCallParam& iprm);
    void start_session(const std::shared_ptr<SipCall>& call);
    void handle_call_disconnected(int call_id, const std::string& reason);
    void register_call(const std::shared_ptr<SipCall>& call);
    void unregister_call(int call_id);

    Config config_;
    SessionManager& sessions_;
    std::unique_ptr<pj::Endpoint> endpoint_;
    std::unique_ptr<SipAccount> account_;
    std::unordered_map<int, std::shared_ptr<SipCall>> calls_;
    std::mutex calls_mutex_;
    std::atomic<bool> quitting_{false};
};

// Session language and agent requested by the caller through X-Language /
// X-Agent headers of the INVITE.
SessionConfig session_config_from_invite(const std::string& invite,
                                         const std::string& default_language);

}
