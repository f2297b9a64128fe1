#include "voice_gateway/session/session_manager.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include "voice_gateway/config.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/services/transport.hpp"
#include "voice_gateway/utils/async.hpp"

namespace voice_gateway {

namespace {

std::chrono::system_clock::time_point to_system(Clock::time_point at) {
    const auto age = Clock::now() - at;
    return std::chrono::system_clock::now() -
           std::chrono::duration_cast<std::chrono::system_clock::duration>(age);
}

}

SessionManager::Options SessionManager::Options::from_config(const Config& config) {
    Options options;
    options.max_sessions = static_cast<size_t>(std::max(0, config.max_sessions));
    options.idle_timeout = std::chrono::milliseconds(config.session_idle_timeout_ms);
    options.reap_interval = std::chrono::milliseconds(config.session_reap_interval_ms);
    options.teardown_grace = std::chrono::milliseconds(config.session_teardown_grace_ms);
    options.default_agent = config.default_agent;
    options.allowed_agents = config.allowed_agents;
    return options;
}

SessionManager::SessionManager(Options options, PipelineSettings settings, PipelineServices services)
    : options_(std::move(options)), settings_(std::move(settings)), services_(std::move(services)) {
    reaper_ = std::thread([this]() { run_reaper(); });
}

SessionManager::~SessionManager() {
    shutdown();
}

std::string SessionManager::next_session_id() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << generator()
        << std::setw(16) << generator();
    return oss.str();
}

SessionInfo SessionManager::create_session(std::shared_ptr<Transport> transport,
                                           SessionConfig config) {
    if (!transport) {
        throw SessionError("transport is required");
    }
    config = normalize_session_config(std::move(config), options_.default_agent);
    if (!options_.allowed_agents.empty() &&
        std::find(options_.allowed_agents.begin(), options_.allowed_agents.end(), config.agent) ==
            options_.allowed_agents.end()) {
        throw SessionError("unknown agent: " + config.agent);
    }

    const auto transport_id = transport->id();
    auto entry = std::make_shared<Entry>();
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            throw SessionError("session manager is shut down");
        }
        const auto bound = by_transport_.find(transport_id);
        if (bound != by_transport_.end()) {
            throw SessionError("transport " + transport_id + " is already bound to session " +
                               bound->second);
        }
        if (sessions_.size() >= options_.max_sessions) {
            throw SessionError("session limit reached");
        }
        do {
            id = next_session_id();
        } while (sessions_.count(id) != 0);

        const auto now = std::chrono::system_clock::now();
        entry->info.id = id;
        entry->info.transport_id = transport_id;
        entry->info.config = config;
        entry->info.state = SessionState::Connecting;
        entry->info.created_at = now;
        entry->info.last_activity = now;
        sessions_.emplace(id, entry);
        by_transport_.emplace(transport_id, id);
    }

    std::shared_ptr<SessionPipeline> pipeline;
    try {
        pipeline = std::make_shared<SessionPipeline>(
            id, config, settings_, services_, transport,
            [this, id](const std::string& reason) { schedule_teardown(id, reason); });
        pipeline->start();
    } catch (const std::exception& ex) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.erase(id);
            by_transport_.erase(transport_id);
        }
        logging::error("Session setup failed",
                       {kv("session_id", id), kv("transport_id", transport_id),
                        kv("error", ex.what())});
        throw SessionError(std::string("session setup failed: ") + ex.what());
    }

    bool closed_meanwhile = false;
    SessionInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry->info.state == SessionState::Connecting) {
            entry->pipeline = pipeline;
            entry->info.state = SessionState::Active;
            info = snapshot(*entry);
        } else {
            closed_meanwhile = true;
        }
    }
    if (closed_meanwhile) {
        teardown(pipeline);
        throw SessionError("session " + id + " was closed during setup");
    }

    publish_gauge();
    logging::info("Session created",
                  {kv("session_id", id),
                   kv("transport_id", transport_id),
                   kv("agent", config.agent),
                   kv("language", config.language)});
    return info;
}

void SessionManager::destroy_session(const std::string& id) {
    std::shared_ptr<Entry> entry;
    std::shared_ptr<SessionPipeline> pipeline;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return;
        }
        entry = it->second;
        if (entry->info.state == SessionState::Closing ||
            entry->info.state == SessionState::Closed) {
            return;
        }
        entry->info.state = SessionState::Closing;
        pipeline = entry->pipeline;
    }

    logging::info("Destroying session", {kv("session_id", id)});
    if (pipeline) {
        teardown(pipeline);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->info.state = SessionState::Closed;
        entry->pipeline.reset();
        sessions_.erase(id);
        const auto bound = by_transport_.find(entry->info.transport_id);
        if (bound != by_transport_.end() && bound->second == id) {
            by_transport_.erase(bound);
        }
    }
    publish_gauge();
    logging::info("Session closed", {kv("session_id", id)});
}

void SessionManager::teardown(const std::shared_ptr<SessionPipeline>& pipeline) {
    // The stop runs on its own worker that keeps the pipeline alive, so a
    // stuck external call delays only that worker.
    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    utils::run_async([pipeline, done]() {
        pipeline->stop();
        done->set_value();
    });
    if (finished.wait_for(options_.teardown_grace) == std::future_status::timeout) {
        logging::warn("Session teardown exceeded grace period, releasing anyway",
                      {kv("session_id", pipeline->id()),
                       kv("grace_ms", options_.teardown_grace.count())});
    }
    try {
        pipeline->transport()->close();
    } catch (const std::exception& ex) {
        logging::warn("Transport close failed",
                      {kv("session_id", pipeline->id()), kv("error", ex.what())});
    }
}

bool SessionManager::route_inbound_frame(const std::string& id, AudioFrame frame) {
    std::shared_ptr<SessionPipeline> pipeline;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end() || it->second->info.state != SessionState::Active) {
            return false;
        }
        pipeline = it->second->pipeline;
    }
    return pipeline && pipeline->push_inbound(std::move(frame));
}

void SessionManager::handle_transport_lost(const std::string& id, const std::string& reason) {
    Metrics::instance().increment_event("transport_lost");
    logging::warn("Transport lost", {kv("session_id", id), kv("reason", reason)});
    schedule_teardown(id, "transport lost: " + reason);
}

void SessionManager::schedule_teardown(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return;
    }
    doomed_.push_back(Doomed{id, reason});
    reaper_cv_.notify_all();
}

void SessionManager::run_reaper() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shut_down_) {
        reaper_cv_.wait_for(lock, options_.reap_interval,
                            [this] { return shut_down_ || !doomed_.empty(); });
        if (shut_down_) {
            break;
        }
        auto doomed = std::move(doomed_);
        doomed_.clear();
        if (options_.idle_timeout.count() > 0) {
            const auto now = Clock::now();
            for (const auto& item : sessions_) {
                const auto& entry = item.second;
                if (entry->info.state == SessionState::Active && entry->pipeline &&
                    now - entry->pipeline->last_activity() > options_.idle_timeout) {
                    doomed.push_back(Doomed{item.first, "idle timeout"});
                }
            }
        }
        if (doomed.empty()) {
            continue;
        }
        lock.unlock();
        for (const auto& item : doomed) {
            logging::info("Reaping session",
                          {kv("session_id", item.id), kv("reason", item.reason)});
            destroy_session(item.id);
        }
        lock.lock();
    }
}

void SessionManager::publish_gauge() {
    Metrics::instance().set_active_sessions(static_cast<int64_t>(size()));
}

SessionInfo SessionManager::snapshot(const Entry& entry) const {
    SessionInfo info = entry.info;
    if (entry.pipeline) {
        info.turn_state = entry.pipeline->turn_state();
        info.last_activity = to_system(entry.pipeline->last_activity());
    }
    return info;
}

std::vector<SessionInfo> SessionManager::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionInfo> result;
    result.reserve(sessions_.size());
    for (const auto& item : sessions_) {
        result.push_back(snapshot(*item.second));
    }
    return result;
}

std::optional<SessionInfo> SessionManager::find_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return snapshot(*it->second);
}

std::optional<std::string> SessionManager::session_for_transport(
    const std::string& transport_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = by_transport_.find(transport_id);
    if (it == by_transport_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::vector<TranscriptEvent>> SessionManager::transcript_events(
    const std::string& id, uint64_t after_sequence) const {
    std::shared_ptr<SessionPipeline> pipeline;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end() || !it->second->pipeline) {
            return std::nullopt;
        }
        pipeline = it->second->pipeline;
    }
    return pipeline->transcript().events_since(after_sequence);
}

size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionManager::shutdown() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (const auto& item : sessions_) {
            ids.push_back(item.first);
        }
        reaper_cv_.notify_all();
    }
    if (reaper_.joinable()) {
        reaper_.join();
    }
    for (const auto& id : ids) {
        destroy_session(id);
    }
    logging::info("Session manager stopped", {kv("sessions_closed", ids.size())});
}

}
