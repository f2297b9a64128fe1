#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_gateway/config.hpp"

namespace voice_gateway {

class SessionManager;

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

// Operational API: health, metrics, agents, ICE servers and read/delete
// access to live sessions and their transcripts.
class RestServer {
public:
    // Agents offered by the backend; may throw, the route then falls back to
    // the configured list.
    using AssistantsProvider = std::function<nlohmann::json()>;

    RestServer(const Config& config, SessionManager& sessions, AssistantsProvider assistants);

    void start();
    void stop();

    RestResponse handle_assistants() const;
    RestResponse handle_rtc_config() const;
    RestResponse handle_list_sessions() const;
    RestResponse handle_get_session(const std::string& id) const;
    RestResponse handle_session_events(const std::string& id, const std::string& after) const;
    RestResponse handle_delete_session(const std::string& id);

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    SessionManager& sessions_;
    AssistantsProvider assistants_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

// ICE servers handed to clients: configured STUN servers (or a public
// default) plus the TURN relay when one is configured.
nlohmann::json build_ice_servers(const Config& config);

}
