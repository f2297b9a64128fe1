#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "voice_gateway/session/session_pipeline.hpp"
#include "voice_gateway/session/types.hpp"

namespace voice_gateway {

struct Config;
class Transport;

// Registry of live sessions. Owns every SessionPipeline; transports and the
// REST server only ever see session ids and SessionInfo snapshots.
class SessionManager {
public:
    struct Options {
        size_t max_sessions = 32;
        std::chrono::milliseconds idle_timeout{300000};
        std::chrono::milliseconds reap_interval{1000};
        std::chrono::milliseconds teardown_grace{2000};
        std::string default_agent = "simple_agent";
        // Empty means any agent is accepted.
        std::vector<std::string> allowed_agents;

        static Options from_config(const Config& config);
    };

    SessionManager(Options options, PipelineSettings settings, PipelineServices services);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Throws SessionError when the transport is already bound, the agent is
    // not allowed or the session limit is reached.
    SessionInfo create_session(std::shared_ptr<Transport> transport, SessionConfig config);
    // Idempotent; unknown ids are ignored.
    void destroy_session(const std::string& id);
    bool route_inbound_frame(const std::string& id, AudioFrame frame);
    // Schedules teardown on the reaper thread; safe to call from any thread.
    void handle_transport_lost(const std::string& id, const std::string& reason);

    std::vector<SessionInfo> list_sessions() const;
    std::optional<SessionInfo> find_session(const std::string& id) const;
    std::optional<std::string> session_for_transport(const std::string& transport_id) const;
    std::optional<std::vector<TranscriptEvent>> transcript_events(const std::string& id,
                                                                  uint64_t after_sequence) const;
    size_t size() const;

    void shutdown();

private:
    struct Entry {
        SessionInfo info;
        std::shared_ptr<SessionPipeline> pipeline;
    };

    struct Doomed {
        std::string id;
        std::string reason;
    };

    void schedule_teardown(const std::string& id, const std::string& reason);
    void teardown(const std::shared_ptr<SessionPipeline>& pipeline);
    void run_reaper();
    void publish_gauge();
    SessionInfo snapshot(const Entry& entry) const;
    std::string next_session_id();

    Options options_;
    PipelineSettings settings_;
    PipelineServices services_;

    mutable std::mutex mutex_;
    std::condition_variable reaper_cv_;
    std::map<std::string, std::shared_ptr<Entry>> sessions_;
    std::map<std::string, std::string> by_transport_;
    std::vector<Doomed> doomed_;
    bool shut_down_ = false;
    std::thread reaper_;
};

}
