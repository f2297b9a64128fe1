#include "voice_gateway/server/rest_server.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/session/session_manager.hpp"

namespace voice_gateway {

namespace {

constexpr const char* kDefaultStunServer = "stun:stun.l.google.com:19302";
constexpr const char* kSessionPattern = R"(/sessions/([A-Za-z0-9_-]+))";
constexpr const char* kSessionEventsPattern = R"(/sessions/([A-Za-z0-9_-]+)/events)";

RestResponse not_found(const std::string& id) {
    return {404, {{"message", "session not found"}, {"session_id", id}}};
}

}

nlohmann::json build_ice_servers(const Config& config) {
    nlohmann::json servers = nlohmann::json::array();
    if (config.sip_stun_servers.empty()) {
        servers.push_back({{"urls", kDefaultStunServer}});
    }
    for (const auto& stun : config.sip_stun_servers) {
        const auto url = stun.rfind("stun:", 0) == 0 ? stun : "stun:" + stun;
        servers.push_back({{"urls", url}});
    }
    if (config.turn_server_url) {
        nlohmann::json turn = {{"urls", *config.turn_server_url}};
        if (config.turn_username) {
            turn["username"] = *config.turn_username;
        }
        if (config.turn_password) {
            turn["credential"] = *config.turn_password;
        }
        servers.push_back(std::move(turn));
    }
    return servers;
}

RestServer::RestServer(const Config& config, SessionManager& sessions, AssistantsProvider assistants)
    : config_(config), sessions_(sessions), assistants_(std::move(assistants)) {}

RestResponse RestServer::handle_assistants() const {
    nlohmann::json items = nlohmann::json::array();
    if (assistants_) {
        try {
            items = assistants_();
        } catch (const std::exception& ex) {
            logging::warn("Assistant listing failed, using configured agents",
                          {kv("error", ex.what())});
        }
    }
    if (!items.is_array() || items.empty()) {
        items = nlohmann::json::array();
        auto agents = config_.allowed_agents;
        if (agents.empty()) {
            agents.push_back(config_.default_agent);
        }
        for (const auto& agent : agents) {
            items.push_back({{"assistant_id", agent}, {"display_name", agent}});
        }
    } else if (!config_.allowed_agents.empty()) {
        nlohmann::json allowed = nlohmann::json::array();
        for (const auto& item : items) {
            const auto id = item.value("assistant_id", std::string());
            if (std::find(config_.allowed_agents.begin(), config_.allowed_agents.end(), id) !=
                config_.allowed_agents.end()) {
                allowed.push_back(item);
            }
        }
        items = std::move(allowed);
    }
    return {200, {{"default", config_.default_agent}, {"assistants", items}}};
}

RestResponse RestServer::handle_rtc_config() const {
    return {200, {{"iceServers", build_ice_servers(config_)}}};
}

RestResponse RestServer::handle_list_sessions() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& info : sessions_.list_sessions()) {
        items.push_back(to_json(info));
    }
    return {200, {{"sessions", items}}};
}

RestResponse RestServer::handle_get_session(const std::string& id) const {
    const auto info = sessions_.find_session(id);
    if (!info) {
        return not_found(id);
    }
    return {200, to_json(*info)};
}

RestResponse RestServer::handle_session_events(const std::string& id,
                                               const std::string& after) const {
    uint64_t after_sequence = 0;
    if (!after.empty()) {
        const bool digits = std::all_of(after.begin(), after.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        });
        try {
            if (!digits) {
                throw std::invalid_argument(after);
            }
            after_sequence = std::stoull(after);
        } catch (const std::exception&) {
            return {400, {{"message", "invalid 'after' parameter"}}};
        }
    }
    const auto events = sessions_.transcript_events(id, after_sequence);
    if (!events) {
        return not_found(id);
    }
    nlohmann::json items = nlohmann::json::array();
    for (const auto& event : *events) {
        items.push_back(to_json(event));
    }
    return {200, {{"session_id", id}, {"events", items}}};
}

RestResponse RestServer::handle_delete_session(const std::string& id) {
    const bool existed = sessions_.find_session(id).has_value();
    sessions_.destroy_session(id);
    return {200, {{"session_id", id}, {"closed", existed}}};
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        Metrics::instance().increment_request();
        logging::debug("REST request",
                       {kv("method", req.method), kv("path", req.path), kv("status", res.status)});
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Get("/assistants", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, handle_assistants());
    });

    server_->Get("/rtc-config", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, handle_rtc_config());
    });

    server_->Get("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, handle_list_sessions());
    });

    server_->Get(kSessionEventsPattern, [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto after = req.has_param("after") ? req.get_param_value("after") : std::string();
        write_json(res, handle_session_events(req.matches[1].str(), after));
    });

    server_->Get(kSessionPattern, [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, handle_get_session(req.matches[1].str()));
    });

    server_->Delete(kSessionPattern, [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto session_id = req.matches[1].str();
        try {
            write_json(res, handle_delete_session(session_id));
        } catch (const std::exception& ex) {
            logging::error("Failed to close session",
                           {kv("session_id", session_id), kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"failed to close session"})", "application/json");
        }
    });

    server_thread_ = std::thread([this]() {
        logging::info("REST server listening", {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server stopped listening", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
