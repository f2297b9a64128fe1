#include "voice_gateway/sip/app.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/session/session_manager.hpp"
#include "voice_gateway/sip/account.hpp"
#include "voice_gateway/sip/call.hpp"
#include "voice_gateway/utils/async.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway {

SessionConfig session_config_from_invite(const std::string& invite,
                                         const std::string& default_language) {
    SessionConfig config;
    config.language = utils::find_header(invite, "X-Language").value_or(default_language);
    if (config.language.empty()) {
        config.language = default_language;
    }
    config.agent = utils::find_header(invite, "X-Agent").value_or("");
    return config;
}

SipApp::SipApp(Config config, SessionManager& sessions)
    : config_(std::move(config)), sessions_(sessions) {}

SipApp::~SipApp() {
    stop();
}

void SipApp::init() {
    init_pjsip();
}

void SipApp::run() {
    int consecutive_empty_cycles = 0;
    while (!quitting_) {
        const auto processed = handle_events();
        if (processed == 0) {
            ++consecutive_empty_cycles;
            const auto delay =
                consecutive_empty_cycles > 10 ? std::min(config_.async_delay * 2, 0.1)
                                              : config_.async_delay;
            std::this_thread::sleep_for(
                std::chrono::duration<double>(delay));
        } else {
            consecutive_empty_cycles = 0;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void SipApp::request_stop() {
    quitting_ = true;
}

void SipApp::stop() {
    quitting_ = true;
    shutdown_pjsip();
}

const Config& SipApp::config() const {
    return config_;
}

SessionManager& SipApp::sessions() {
    return sessions_;
}

int SipApp::handle_events() {
    if (!endpoint_) {
        return 0;
    }
    try {
        const auto delay_ms = static_cast<int>(config_.events_delay * 1000.0);
        return endpoint_->libHandleEvents(delay_ms);
    } catch (const pj::Error& err) {
        logging::error("PJSIP handle events error",
                       {kv("reason", err.reason), kv("status", err.status)});
    } catch (const std::exception& ex) {
        logging::error("PJSIP handle events exception", {kv("error", ex.what())});
    }
    return 0;
}

void SipApp::handle_incoming_call(pj::OnIncomingCallParam& iprm) {
    auto call = std::make_shared<SipCall>(*this, *account_, iprm.callId);
    if (sessions_.size() >= static_cast<size_t>(config_.max_sessions)) {
        logging::warn("Incoming call rejected, session limit reached",
                      {kv("call_id", iprm.callId), kv("max_sessions", config_.max_sessions)});
        call->hangup(PJSIP_SC_BUSY_HERE);
        return;
    }
    call->set_session_config(
        session_config_from_invite(iprm.rdata.wholeMsg, config_.default_language));
    logging::info("Incoming call",
                  {kv("call_id", iprm.callId),
                   kv("transport_id", call->id()),
                   kv("language", call->session_config().language),
                   kv("agent", call->session_config().agent)});
    register_call(call);
    call->answer(PJSIP_SC_RINGING);
    call->answer(PJSIP_SC_OK);
}

void SipApp::start_session(const std::shared_ptr<SipCall>& call) {
    // Acquiring pooled clients may block; keep it off the PJSIP thread.
    utils::run_async([this, call]() {
        try {
            const auto info = sessions_.create_session(call, call->session_config());
            call->set_session_id(info.id);
            logging::info("Call bound to session",
                          {kv("transport_id", call->id()), kv("session_id", info.id)});
            if (call->is_closed()) {
                sessions_.handle_transport_lost(info.id, "call ended during session setup");
            }
        } catch (const SessionError& ex) {
            logging::warn("Session rejected for call",
                          {kv("transport_id", call->id()), kv("error", ex.what())});
            call->close();
        } catch (const std::exception& ex) {
            logging::error("Session start failed for call",
                           {kv("transport_id", call->id()), kv("error", ex.what())});
            call->close();
        }
    });
}

void SipApp::handle_call_disconnected(int call_id, const std::string& reason) {
    std::shared_ptr<SipCall> call;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = calls_.find(call_id);
        if (it == calls_.end()) {
            return;
        }
        call = it->second;
    }
    auto session_id = call->session_id();
    if (!session_id) {
        session_id = sessions_.session_for_transport(call->id());
    }
    if (session_id) {
        sessions_.handle_transport_lost(*session_id, reason);
    }
    unregister_call(call_id);
}

void SipApp::register_call(const std::shared_ptr<SipCall>& call) {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    const auto call_id = call->getId();
    if (call_id != PJSUA_INVALID_ID) {
        calls_[call_id] = call;
    }
}

void SipApp::unregister_call(int call_id) {
    std::shared_ptr<SipCall> call;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = calls_.find(call_id);
        if (it == calls_.end()) {
            return;
        }
        call = std::move(it->second);
        calls_.erase(it);
    }
    // Released off the PJSIP callback so a call never deletes itself.
    utils::run_async([call = std::move(call)]() mutable { call.reset(); });
}

void SipApp::init_pjsip() {
    endpoint_ = std::make_unique<pj::Endpoint>();
    endpoint_->libCreate();

    pj::EpConfig ep_cfg;
    ep_cfg.uaConfig.threadCnt = 0;
    ep_cfg.uaConfig.mainThreadOnly = false;
    ep_cfg.uaConfig.maxCalls = static_cast<unsigned>(std::max(config_.max_sessions, 1));
    ep_cfg.medConfig.threadCnt = 1;
    ep_cfg.medConfig.hasIoqueue = true;
    ep_cfg.medConfig.clockRate = static_cast<unsigned>(config_.audio_sample_rate);
    ep_cfg.medConfig.ecTailLen = static_cast<unsigned>(config_.ec_tail_len);
    ep_cfg.medConfig.sndAutoCloseTime = -1;
    ep_cfg.logConfig.level = static_cast<unsigned>(config_.pjsip_log_level);
    if (config_.log_filename) {
        ep_cfg.logConfig.filename = *config_.log_filename;
    }
    if (!config_.sip_stun_servers.empty()) {
        pj::StringVector stun_servers;
        for (const auto& stun_server : config_.sip_stun_servers) {
            stun_servers.push_back(stun_server);
        }
        ep_cfg.uaConfig.stunServer = stun_servers;
    }
    endpoint_->libInit(ep_cfg);

    for (const auto& item : config_.codecs_priority) {
        endpoint_->codecSetPriority(item.first, static_cast<pj_uint8_t>(item.second));
    }
    for (const auto& codec : endpoint_->codecEnum2()) {
        logging::info("Supported codec",
                      {kv("codec_id", codec.codecId), kv("priority", static_cast<int>(codec.priority))});
    }
    if (config_.sip_null_device) {
        endpoint_->audDevManager().setNullDev();
    }
    pj::TransportConfig sip_tp_config;
    sip_tp_config.port = static_cast<unsigned>(config_.sip_port);
    endpoint_->transportCreate(PJSIP_TRANSPORT_UDP, sip_tp_config);
    if (config_.sip_use_tcp) {
        endpoint_->transportCreate(PJSIP_TRANSPORT_TCP, sip_tp_config);
    }
    endpoint_->libStart();

    pj::AccountConfig account_cfg;
    if (config_.sip_caller_id) {
        account_cfg.idUri = "\"" + *config_.sip_caller_id + "\" <sip:" + config_.sip_user +
                            "@" + config_.sip_domain + ">";
    } else {
        account_cfg.idUri = "sip:" + config_.sip_user + "@" + config_.sip_domain;
    }
    account_cfg.regConfig.registrarUri =
        "sip:" + config_.sip_domain + (config_.sip_use_tcp ? ";transport=tcp" : "");
    pj::AuthCredInfo cred("digest", "*", config_.sip_login, 0, config_.sip_password);
    account_cfg.sipConfig.authCreds.push_back(cred);
    if (!config_.sip_proxy_servers.empty()) {
        pj::StringVector proxy_servers;
        for (const auto& proxy_server : config_.sip_proxy_servers) {
            proxy_servers.push_back(proxy_server);
        }
        account_cfg.sipConfig.proxies = proxy_servers;
    }
    account_cfg.natConfig.iceEnabled = config_.sip_use_ice;
    if (config_.turn_server_url) {
        auto server = *config_.turn_server_url;
        if (server.rfind("turn:", 0) == 0) {
            server = server.substr(5);
        }
        account_cfg.natConfig.turnEnabled = true;
        account_cfg.natConfig.turnServer = server;
        account_cfg.natConfig.turnConnType = PJ_TURN_TP_UDP;
        account_cfg.natConfig.turnUserName = config_.turn_username.value_or("");
        account_cfg.natConfig.turnPasswordType = 0;
        account_cfg.natConfig.turnPassword = config_.turn_password.value_or("");
    }

    account_ = std::make_unique<SipAccount>(*this);
    account_->create(account_cfg);
    logging::info("SIP account created",
                  {kv("uri", account_cfg.idUri), kv("port", config_.sip_port)});
}

void SipApp::shutdown_pjsip() {
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls_.clear();
    }
    if (account_) {
        account_->shutdown();
        account_.reset();
    }
    if (endpoint_) {
        endpoint_->libDestroy();
        endpoint_.reset();
    }
}

}
