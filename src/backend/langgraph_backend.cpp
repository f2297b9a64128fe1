#include "voice_gateway/backend/langgraph_backend.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <utility>

#include "voice_gateway/backend/sse.hpp"
#include "voice_gateway/config.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/async.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway {

namespace {

struct RunState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> deltas;
    bool done = false;
    std::exception_ptr error;
    std::string run_id;
    std::atomic<bool> cancelled{false};
};

class LangGraphReplyStream : public ReplyStream {
public:
    LangGraphReplyStream(std::shared_ptr<RunState> state,
                         std::shared_ptr<BackendClient> client,
                         std::string thread_id)
        : state_(std::move(state)), client_(std::move(client)), thread_id_(std::move(thread_id)) {}

    ~LangGraphReplyStream() override {
        state_->cancelled.store(true);
    }

    std::optional<std::string> next_increment(const utils::CancellationToken& token,
                                              std::chrono::milliseconds timeout) override {
        auto state = state_;
        auto wake = token.on_cancel([state]() {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->cv.notify_all();
        });
        std::unique_lock<std::mutex> lock(state->mutex);
        const bool ready = state->cv.wait_for(lock, timeout, [&] {
            return token.is_cancelled() || state->cancelled.load() || !state->deltas.empty() ||
                   state->done;
        });
        if (token.is_cancelled() || state->cancelled.load()) {
            return std::nullopt;
        }
        if (!ready) {
            throw DeadlineExceeded("no reply increment within " +
                                   std::to_string(timeout.count()) + " ms");
        }
        if (!state->deltas.empty()) {
            auto delta = std::move(state->deltas.front());
            state->deltas.pop_front();
            return delta;
        }
        if (state->error) {
            std::rethrow_exception(state->error);
        }
        return std::nullopt;
    }

    void cancel() override {
        std::string run_id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled.exchange(true) || state_->done) {
                state_->cv.notify_all();
                return;
            }
            run_id = state_->run_id;
            state_->cv.notify_all();
        }
        if (run_id.empty() || thread_id_.empty()) {
            return;
        }
        utils::run_async([client = client_, thread_id = thread_id_, run_id]() {
            try {
                client->post_json("/threads/" + utils::url_encode(thread_id) + "/runs/" +
                                      utils::url_encode(run_id) + "/cancel",
                                  nlohmann::json::object());
            } catch (const BackendError& ex) {
                logging::debug("Run cancel request failed",
                               {kv("thread_id", thread_id), kv("run_id", run_id),
                                kv("error", ex.what())});
            }
        });
    }

private:
    std::shared_ptr<RunState> state_;
    std::shared_ptr<BackendClient> client_;
    std::string thread_id_;
};

nlohmann::json load_history(BackendClient& client, const std::string& thread_id) {
    try {
        const auto state = client.get_json("/threads/" + utils::url_encode(thread_id) + "/state");
        if (state.contains("values") && state["values"].is_object()) {
            const auto& values = state["values"];
            if (values.contains("messages") && values["messages"].is_array()) {
                return values["messages"];
            }
        }
    } catch (const BackendError& ex) {
        logging::debug("Thread history unavailable",
                       {kv("thread_id", thread_id), kv("error", ex.what())});
    }
    return nlohmann::json::array();
}

void handle_event(const SseEvent& event, ReplyDeltaTracker& tracker, RunState& state) {
    if (event.data.empty()) {
        return;
    }
    const auto data = nlohmann::json::parse(event.data, nullptr, false);
    if (data.is_discarded()) {
        logging::debug("Skipping malformed stream event", {kv("event", event.event)});
        return;
    }
    if (event.event == "metadata") {
        if (data.is_object() && data.contains("run_id") && data["run_id"].is_string()) {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.run_id = data["run_id"].get<std::string>();
        }
        return;
    }
    if (auto delta = tracker.on_event(event.event, data)) {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.deltas.push_back(std::move(*delta));
        state.cv.notify_all();
    }
}

}

LangGraphBackend::Options LangGraphBackend::Options::from_config(const Config& config) {
    Options options;
    if (!config.backend_url.empty()) {
        options.base_url = config.backend_url;
    }
    options.authorization_token = config.backend_auth_token;
    options.stream_mode = config.backend_stream_mode;
    options.user_email = config.backend_user_email;
    options.send_history = config.backend_send_history;
    options.request.connect_timeout = std::chrono::milliseconds(
        static_cast<int64_t>(config.backend_connect_timeout * 1000.0));
    options.request.read_timeout = std::chrono::milliseconds(
        static_cast<int64_t>(config.backend_read_timeout * 1000.0));
    options.request.write_timeout = options.request.read_timeout;
    return options;
}

LangGraphBackend::LangGraphBackend(Options options)
    : options_(std::move(options)),
      client_(std::make_shared<BackendClient>(options_.base_url, options_.authorization_token,
                                              options_.request)) {}

std::string LangGraphBackend::create_thread(const std::string& agent) {
    const auto response = client_->post_json("/threads", {{"metadata", {{"agent", agent}}}});
    if (!response.contains("thread_id") || !response["thread_id"].is_string()) {
        throw BackendError("thread creation returned no thread_id");
    }
    auto thread_id = response["thread_id"].get<std::string>();
    logging::info("Backend thread created", {kv("agent", agent), kv("thread_id", thread_id)});
    return thread_id;
}

void LangGraphBackend::delete_thread(const std::string& thread_handle) {
    if (thread_handle.empty()) {
        return;
    }
    client_->delete_json("/threads/" + utils::url_encode(thread_handle));
}

std::unique_ptr<ReplyStream> LangGraphBackend::start(const ChatRequest& request) {
    auto state = std::make_shared<RunState>();
    auto stream = std::make_unique<LangGraphReplyStream>(state, client_, request.thread_handle);

    nlohmann::json configurable = {{"user_email", options_.user_email}};
    if (request.language) {
        configurable["language"] = *request.language;
    }
    nlohmann::json body = {
        {"assistant_id", request.agent},
        {"stream_mode", options_.stream_mode},
        {"config", {{"configurable", configurable}}},
    };
    const auto path = request.thread_handle.empty()
                          ? std::string("/runs/stream")
                          : "/threads/" + utils::url_encode(request.thread_handle) + "/runs/stream";

    utils::run_async([client = client_, state, body = std::move(body), path,
                      thread_id = request.thread_handle, text = request.text,
                      send_history = options_.send_history]() mutable {
        try {
            auto messages = send_history && !thread_id.empty() ? load_history(*client, thread_id)
                                                               : nlohmann::json::array();
            messages.push_back({{"role", "user"}, {"content", text}});
            body["input"] = std::move(messages);

            SseParser parser;
            ReplyDeltaTracker tracker;
            const bool completed = client->post_stream(
                path, body, "text/event-stream", [&](const char* data, size_t length) {
                    if (state->cancelled.load()) {
                        return false;
                    }
                    for (const auto& event : parser.feed(data, length)) {
                        handle_event(event, tracker, *state);
                    }
                    return !state->cancelled.load();
                });
            if (completed) {
                if (auto event = parser.finish()) {
                    handle_event(*event, tracker, *state);
                }
            }
            logging::debug("Backend run finished",
                           {kv("thread_id", thread_id), kv("completed", completed),
                            kv("emitted", tracker.emitted_any())});
        } catch (const std::exception& ex) {
            logging::debug("Backend run failed", {kv("thread_id", thread_id), kv("error", ex.what())});
            std::lock_guard<std::mutex> lock(state->mutex);
            state->error = std::current_exception();
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        state->done = true;
        state->cv.notify_all();
    });
    return stream;
}

nlohmann::json LangGraphBackend::list_assistants() {
    const auto response = client_->post_json(
        "/assistants/search", {{"metadata", nlohmann::json::object()}, {"limit", 100}, {"offset", 0}});
    nlohmann::json items = response;
    if (response.is_object()) {
        items = response.contains("items") ? response["items"] : response.value("results", nlohmann::json::array());
    }
    nlohmann::json result = nlohmann::json::array();
    if (!items.is_array()) {
        return result;
    }
    for (const auto& entry : items) {
        std::string assistant_id;
        if (entry.is_string()) {
            assistant_id = entry.get<std::string>();
        } else if (entry.is_object()) {
            for (const char* key : {"assistant_id", "id", "name"}) {
                if (entry.contains(key) && entry[key].is_string()) {
                    assistant_id = entry[key].get<std::string>();
                    break;
                }
            }
        }
        if (assistant_id.empty()) {
            continue;
        }
        nlohmann::json item = {{"assistant_id", assistant_id}};
        std::string display_name = assistant_id;
        if (entry.is_object()) {
            if (entry.contains("graph_id") && entry["graph_id"].is_string()) {
                item["graph_id"] = entry["graph_id"];
                display_name = entry["graph_id"].get<std::string>();
            }
            if (entry.contains("metadata") && entry["metadata"].is_object() &&
                entry["metadata"].contains("display_name") &&
                entry["metadata"]["display_name"].is_string()) {
                display_name = entry["metadata"]["display_name"].get<std::string>();
            }
            if (entry.contains("name") && entry["name"].is_string()) {
                item["name"] = entry["name"];
                display_name = entry["name"].get<std::string>();
            }
        }
        item["display_name"] = display_name;
        result.push_back(std::move(item));
    }
    return result;
}

}
