#include "voice_gateway/backend/ws_recognition_client.hpp"

#include <condition_variable>
#include <deque>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

std::string replace_scheme(const std::string& base_url) {
    if (base_url.rfind("https://", 0) == 0) {
        return "wss://" + base_url.substr(8);
    }
    if (base_url.rfind("http://", 0) == 0) {
        return "ws://" + base_url.substr(7);
    }
    if (base_url.rfind("ws://", 0) == 0 || base_url.rfind("wss://", 0) == 0) {
        return base_url;
    }
    return "ws://" + base_url;
}

}

struct WsRecognitionClient::Connection {
    WsClient client;
    websocketpp::connection_hdl handle;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<RecognitionEvent> events;
    bool open = false;
    bool closed = false;
    std::optional<std::string> error;

    void push(RecognitionEvent event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(std::move(event));
        cv.notify_all();
    }

    void finish(std::optional<std::string> failure) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!closed) {
            closed = true;
            if (failure && !error) {
                error = std::move(failure);
            }
        }
        cv.notify_all();
    }
};

std::optional<RecognitionEvent> parse_recognition_message(const std::string& payload) {
    const auto message = nlohmann::json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        logging::debug("Ignoring malformed recognition message", {kv("payload", payload)});
        return std::nullopt;
    }
    const auto type = message.contains("type") && message["type"].is_string()
                          ? message["type"].get<std::string>()
                          : std::string();
    if (type == "transcript") {
        RecognitionIncrement increment;
        if (message.contains("text") && message["text"].is_string()) {
            increment.text = message["text"].get<std::string>();
        }
        if (message.contains("is_final") && message["is_final"].is_boolean()) {
            increment.is_final = message["is_final"].get<bool>();
        }
        if (message.contains("confidence") && message["confidence"].is_number()) {
            increment.confidence = message["confidence"].get<double>();
        }
        if (message.contains("language") && message["language"].is_string()) {
            increment.language = message["language"].get<std::string>();
        }
        return RecognitionEvent::text(std::move(increment));
    }
    if (type == "speech_started") {
        return RecognitionEvent::speech_started();
    }
    if (type == "speech_stopped") {
        return RecognitionEvent::speech_stopped();
    }
    if (type == "error") {
        std::string error = "recognition service error";
        if (message.contains("message") && message["message"].is_string()) {
            error = message["message"].get<std::string>();
        }
        return RecognitionEvent::failure(error);
    }
    return std::nullopt;
}

WsRecognitionClient::WsRecognitionClient(Options options) : options_(std::move(options)) {}

WsRecognitionClient::~WsRecognitionClient() {
    cancel();
}

std::string WsRecognitionClient::make_stream_url(const std::string& language,
                                                 int sample_rate) const {
    auto base = replace_scheme(options_.base_url);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/stream" +
           utils::build_query({{"language", language}, {"sample_rate", std::to_string(sample_rate)}});
}

std::shared_ptr<WsRecognitionClient::Connection> WsRecognitionClient::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

void WsRecognitionClient::start(const std::string& language, int sample_rate) {
    cancel();
    const auto url = make_stream_url(language, sample_rate);
    if (url.rfind("wss://", 0) == 0) {
        throw RecognitionFailure("TLS recognition endpoints are not supported: " + url);
    }

    auto connection = std::make_shared<Connection>();
    auto* raw = connection.get();
    auto& client = connection->client;
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio();

    client.set_open_handler([raw](websocketpp::connection_hdl) {
        std::lock_guard<std::mutex> lock(raw->mutex);
        raw->open = true;
        raw->cv.notify_all();
    });
    client.set_message_handler([raw](websocketpp::connection_hdl, WsClient::message_ptr msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            return;
        }
        if (auto event = parse_recognition_message(msg->get_payload())) {
            if (event->kind == RecognitionEvent::Kind::Failure) {
                raw->finish(event->error);
                return;
            }
            raw->push(std::move(*event));
        }
    });
    client.set_close_handler([raw](websocketpp::connection_hdl hdl) {
        std::optional<std::string> failure;
        websocketpp::lib::error_code ec;
        auto conn = raw->client.get_con_from_hdl(hdl, ec);
        if (!ec && conn->get_remote_close_code() != websocketpp::close::status::normal &&
            conn->get_remote_close_code() != websocketpp::close::status::going_away) {
            failure = "recognition stream closed: " + conn->get_remote_close_reason();
        }
        raw->finish(std::move(failure));
    });
    client.set_fail_handler([raw](websocketpp::connection_hdl hdl) {
        std::string reason = "recognition connection failed";
        websocketpp::lib::error_code ec;
        auto conn = raw->client.get_con_from_hdl(hdl, ec);
        if (!ec) {
            reason += ": " + conn->get_ec().message();
        }
        raw->finish(reason);
    });

    websocketpp::lib::error_code ec;
    auto conn = client.get_connection(url, ec);
    if (ec) {
        throw RecognitionFailure("invalid recognition url " + url + ": " + ec.message());
    }
    connection->handle = conn->get_handle();
    client.connect(conn);

    // The worker keeps the connection alive until the asio loop returns.
    std::thread([connection]() {
        try {
            connection->client.run();
        } catch (const std::exception& ex) {
            connection->finish(std::string("recognition loop failed: ") + ex.what());
            return;
        }
        connection->finish(std::nullopt);
    }).detach();

    {
        std::unique_lock<std::mutex> lock(connection->mutex);
        connection->cv.wait_for(lock, options_.connect_timeout,
                                [&] { return connection->open || connection->closed; });
        if (!connection->open) {
            const auto reason = connection->error.value_or("recognition connect timed out");
            lock.unlock();
            connection->client.stop();
            throw RecognitionFailure(reason);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connection_ = std::move(connection);
    logging::debug("Recognition stream connected", {kv("url", url)});
}

void WsRecognitionClient::send_audio(const AudioFrame& frame) {
    auto connection = current();
    if (!connection) {
        throw RecognitionFailure("recognition stream is not open");
    }
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        if (connection->closed) {
            throw RecognitionFailure(connection->error.value_or("recognition stream closed"));
        }
    }
    websocketpp::lib::error_code ec;
    connection->client.send(connection->handle, frame.samples.data(),
                            frame.samples.size() * sizeof(int16_t),
                            websocketpp::frame::opcode::binary, ec);
    if (ec) {
        throw RecognitionFailure("recognition send failed: " + ec.message());
    }
}

std::optional<RecognitionEvent> WsRecognitionClient::next_increment(
    const utils::CancellationToken& token) {
    auto connection = current();
    if (!connection) {
        return std::nullopt;
    }
    auto wake = token.on_cancel([connection]() {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->cv.notify_all();
    });
    std::unique_lock<std::mutex> lock(connection->mutex);
    connection->cv.wait(lock, [&] {
        return token.is_cancelled() || !connection->events.empty() || connection->closed;
    });
    if (token.is_cancelled()) {
        return std::nullopt;
    }
    if (!connection->events.empty()) {
        auto event = std::move(connection->events.front());
        connection->events.pop_front();
        return event;
    }
    if (connection->error) {
        throw RecognitionFailure(*connection->error);
    }
    return std::nullopt;
}

void WsRecognitionClient::cancel() {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection = std::move(connection_);
        connection_.reset();
    }
    if (!connection) {
        return;
    }
    connection->finish(std::nullopt);
    websocketpp::lib::error_code ec;
    connection->client.close(connection->handle, websocketpp::close::status::going_away,
                             "cancelled", ec);
    if (ec) {
        connection->client.stop();
    }
}

}
