#include "voice_gateway/pipeline/backend_dispatcher.hpp"

#include <exception>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/utils/async.hpp"

namespace voice_gateway {

BackendBinding BackendRoutingTable::resolve(const std::string& agent,
                                            const std::string& language_mode,
                                            const std::function<std::string()>& create_thread) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Key key{agent, language_mode};
    auto it = bindings_.find(key);
    if (it != bindings_.end()) {
        it->second.last_used = Clock::now();
        return it->second;
    }
    BackendBinding binding;
    binding.agent = agent;
    binding.language_mode = language_mode;
    binding.thread_handle = create_thread();
    binding.created_at = Clock::now();
    binding.last_used = binding.created_at;
    bindings_.emplace(key, binding);
    return binding;
}

std::optional<BackendBinding> BackendRoutingTable::find(const std::string& agent,
                                                        const std::string& language_mode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = bindings_.find(Key{agent, language_mode});
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BackendBinding> BackendRoutingTable::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BackendBinding> result;
    result.reserve(bindings_.size());
    for (auto& item : bindings_) {
        result.push_back(std::move(item.second));
    }
    bindings_.clear();
    return result;
}

size_t BackendRoutingTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

DispatchedReply::DispatchedReply(BackendDispatcher& dispatcher,
                                 ChatRequest request,
                                 std::string language_mode)
    : dispatcher_(dispatcher),
      request_(std::move(request)),
      language_mode_(std::move(language_mode)),
      dispatched_at_(Clock::now()) {}

void DispatchedReply::open(const utils::CancellationToken& token) {
    ++attempts_;
    auto backend = dispatcher_.backend_;
    const auto agent = request_.agent;
    const auto binding = dispatcher_.routing_.resolve(agent, language_mode_, [&]() {
        return utils::run_with_deadline(
            [backend, agent]() { return backend->create_thread(agent); },
            dispatcher_.options_.connect_timeout, token, "backend thread creation");
    });
    request_.thread_handle = binding.thread_handle;
    auto stream = backend->start(request_);
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_ = std::move(stream);
}

void DispatchedReply::on_connection_failure(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_.reset();
    }
    if (forwarded_ || attempts_ >= dispatcher_.options_.max_attempts) {
        Metrics::instance().increment_event("backend_unavailable");
        throw BackendUnavailable("backend unreachable after " + std::to_string(attempts_) +
                                 " attempts: " + message);
    }
    logging::warn("Backend connection failed, retrying",
                  {kv("session_id", dispatcher_.session_id_),
                   kv("agent", request_.agent),
                   kv("attempt", attempts_),
                   kv("error", message)});
}

std::optional<std::string> DispatchedReply::next_increment(const utils::CancellationToken& token) {
    while (!token.is_cancelled()) {
        try {
            if (!stream_) {
                open(token);
            }
            const auto timeout = forwarded_ ? dispatcher_.options_.idle_timeout
                                            : dispatcher_.options_.first_token_timeout;
            auto delta = stream_->next_increment(token, timeout);
            if (!delta) {
                return std::nullopt;
            }
            if (!forwarded_) {
                forwarded_ = true;
                const std::chrono::duration<double> elapsed = Clock::now() - dispatched_at_;
                Metrics::instance().observe_latency("generate", elapsed.count());
                Metrics::instance().observe_latency_summary("generate", elapsed.count());
            }
            return delta;
        } catch (const OperationCancelled&) {
            return std::nullopt;
        } catch (const BackendConnectionError& ex) {
            on_connection_failure(ex.what());
        } catch (const DeadlineExceeded& ex) {
            if (!stream_) {
                // Thread creation did not finish in time.
                on_connection_failure(ex.what());
                continue;
            }
            stream_->cancel();
            Metrics::instance().increment_event("backend_unavailable");
            throw BackendUnavailable(std::string(forwarded_ ? "reply stalled: "
                                                            : "no reply: ") + ex.what());
        } catch (const BackendError& ex) {
            Metrics::instance().increment_event("backend_unavailable");
            throw BackendUnavailable(ex.what());
        }
    }
    return std::nullopt;
}

void DispatchedReply::cancel() {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (stream_) {
        stream_->cancel();
    }
}

BackendDispatcher::BackendDispatcher(std::string session_id,
                                     std::shared_ptr<ChatBackend> backend,
                                     Options options)
    : session_id_(std::move(session_id)), backend_(std::move(backend)), options_(options) {}

std::unique_ptr<DispatchedReply> BackendDispatcher::dispatch(const SessionConfig& config,
                                                             const Utterance& utterance,
                                                             const utils::CancellationToken& token) {
    ChatRequest request;
    request.agent = config.agent;
    request.text = utterance.text();
    request.language = config.is_auto_language() ? utterance.language
                                                 : std::optional<std::string>(config.language);
    logging::info("Dispatching utterance",
                  {kv("session_id", session_id_),
                   kv("utterance_id", utterance.id),
                   kv("agent", config.agent),
                   kv("language", request.language.value_or("auto")),
                   kv("cancelled", token.is_cancelled())});
    return std::make_unique<DispatchedReply>(*this, std::move(request), config.language);
}

void BackendDispatcher::release_bindings() {
    auto bindings = routing_.take_all();
    for (auto& binding : bindings) {
        auto backend = backend_;
        auto session_id = session_id_;
        utils::run_async([backend, session_id, handle = binding.thread_handle]() {
            try {
                backend->delete_thread(handle);
                logging::debug("Backend thread deleted",
                               {kv("session_id", session_id), kv("thread_id", handle)});
            } catch (const std::exception& ex) {
                logging::warn("Backend thread deletion failed",
                              {kv("session_id", session_id),
                               kv("thread_id", handle),
                               kv("error", ex.what())});
            }
        });
    }
}

}
