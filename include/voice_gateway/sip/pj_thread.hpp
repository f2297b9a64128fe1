#pragma once

namespace voice_gateway::sip {

// PJSIP refuses calls from threads it does not know; every thread that may
// touch a call or the endpoint registers itself first.
void ensure_pj_thread_registered(const char* name);

}
