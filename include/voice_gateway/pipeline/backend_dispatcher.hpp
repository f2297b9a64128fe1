#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "voice_gateway/services/chat_backend.hpp"
#include "voice_gateway/session/types.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

struct BackendBinding {
    std::string agent;
    std::string language_mode;
    std::string thread_handle;
    Clock::time_point created_at{};
    Clock::time_point last_used{};
};

// Per-session map (agent, language mode) -> backend thread. Never shared
// between sessions.
class BackendRoutingTable {
public:
    // Returns the existing binding or creates one with `create_thread`.
    BackendBinding resolve(const std::string& agent,
                           const std::string& language_mode,
                           const std::function<std::string()>& create_thread);

    std::optional<BackendBinding> find(const std::string& agent,
                                       const std::string& language_mode) const;
    std::vector<BackendBinding> take_all();
    size_t size() const;

private:
    using Key = std::pair<std::string, std::string>;

    mutable std::mutex mutex_;
    std::map<Key, BackendBinding> bindings_;
};

class BackendDispatcher;

// Lazy reply of one dispatched utterance. The first read resolves the
// binding and opens the backend run. Connection failures are retried once as
// long as nothing has been forwarded; every other failure surfaces as
// BackendUnavailable.
class DispatchedReply {
public:
    DispatchedReply(BackendDispatcher& dispatcher,
                    ChatRequest request,
                    std::string language_mode);

    // Returns nullopt at the end of the reply or once `token` is cancelled.
    std::optional<std::string> next_increment(const utils::CancellationToken& token);
    void cancel();

    bool forwarded_any() const { return forwarded_; }
    int attempts() const { return attempts_; }

private:
    void open(const utils::CancellationToken& token);
    void on_connection_failure(const std::string& message);

    BackendDispatcher& dispatcher_;
    ChatRequest request_;
    std::string language_mode_;
    std::unique_ptr<ReplyStream> stream_;
    std::mutex stream_mutex_;
    bool forwarded_ = false;
    int attempts_ = 0;
    Clock::time_point dispatched_at_;
};

class BackendDispatcher {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds first_token_timeout{30000};
        std::chrono::milliseconds idle_timeout{15000};
        int max_attempts = 2;
    };

    BackendDispatcher(std::string session_id, std::shared_ptr<ChatBackend> backend, Options options);

    std::unique_ptr<DispatchedReply> dispatch(const SessionConfig& config,
                                              const Utterance& utterance,
                                              const utils::CancellationToken& token);

    // Drops every binding and deletes the backend threads in the background.
    void release_bindings();

    BackendRoutingTable& routing_table() { return routing_; }
    const std::string& session_id() const { return session_id_; }

private:
    friend class DispatchedReply;

    std::string session_id_;
    std::shared_ptr<ChatBackend> backend_;
    Options options_;
    BackendRoutingTable routing_;
};

}
