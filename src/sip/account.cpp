#include "voice_gateway/sip/account.hpp"

#include <typeinfo>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/sip/app.hpp"

namespace voice_gateway {

SipAccount::SipAccount(SipApp& app) : app_(app) {}

void SipAccount::onRegState(pj::OnRegStateParam& prm) {
    try {
        const int status_code = static_cast<int>(prm.code);
        logging::info("SIP registration state",
                      {kv("status", status_code),
                       kv("reason", prm.reason)});
        if (status_code / 100 == 5) {
            logging::error("SIP registration server error",
                           {kv("status", status_code),
                            kv("reason", prm.reason)});
        } else if (status_code == 408) {
            logging::warn("SIP registration timeout",
                          {kv("status", status_code),
                           kv("reason", prm.reason)});
        } else if (status_code == 200) {
            pj::PresenceStatus status;
            status.status = PJSUA_BUDDY_STATUS_ONLINE;
            status.note = "Ready to answer";
            setOnlineStatus(status);
            logging::info("SIP registration successful.");
        } else if (status_code != 0) {
            logging::warn("SIP registration failed",
                          {kv("status", status_code),
                           kv("reason", prm.reason)});
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Exception in onRegState",
            {kv("error_type", typeid(ex).name()),
             kv("error", ex.what())});
    }
}

void SipAccount::onIncomingCall(pj::OnIncomingCallParam& iprm) {
    try {
        app_.handle_incoming_call(iprm);
    } catch (const pj::Error& err) {
        logging::error(
            "PJSIP error in onIncomingCall",
            {kv("reason", err.reason),
             kv("status", err.status),
             kv("call_id", iprm.callId)});
        app_.unregister_call(iprm.callId);
    } catch (const std::exception& ex) {
        logging::error(
            "Exception in onIncomingCall",
            {kv("error_type", typeid(ex).name()),
             kv("error", ex.what()),
             kv("call_id", iprm.callId)});
        app_.unregister_call(iprm.callId);
    }
}

}
