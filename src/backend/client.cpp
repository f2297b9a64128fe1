#include "voice_gateway/backend/client.hpp"

#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway {

namespace {

bool is_connection_error(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
        case httplib::Error::SSLConnection:
        case httplib::Error::ProxyConnection:
            return true;
        default:
            return false;
    }
}

std::string describe(const httplib::Error error) {
    return httplib::to_string(error);
}

}

void throw_for_status(int status, const std::string& body, const std::string& what) {
    const auto message = what + " failed with HTTP " + std::to_string(status) +
                         (body.empty() ? "" : ": " + body);
    if (status == 401 || status == 403) {
        throw BackendPermissionError(message);
    }
    if (status == 502 || status == 503 || status == 504) {
        throw BackendConnectionError(message);
    }
    throw BackendError(message);
}

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    if (scheme_ == "https") {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    }
}

std::unique_ptr<httplib::Client> BackendClient::make_client() const {
    auto client = std::make_unique<httplib::Client>(utils::build_url(scheme_, host_, port_, ""));
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        client->enable_server_certificate_verification(false);
    }
#endif
    const auto seconds = [](std::chrono::milliseconds value) {
        return static_cast<time_t>(value.count() / 1000);
    };
    const auto micros = [](std::chrono::milliseconds value) {
        return static_cast<time_t>((value.count() % 1000) * 1000);
    };
    client->set_connection_timeout(seconds(options_.connect_timeout), micros(options_.connect_timeout));
    client->set_read_timeout(seconds(options_.read_timeout), micros(options_.read_timeout));
    client->set_write_timeout(seconds(options_.write_timeout), micros(options_.write_timeout));
    return client;
}

httplib::Headers BackendClient::make_headers(const std::string& accept) const {
    httplib::Headers headers{{"Accept", accept}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return headers;
}

std::string BackendClient::build_path(const std::string& path) const {
    return utils::join_path(base_path_, path);
}

nlohmann::json BackendClient::handle_response(const httplib::Result& result,
                                              const std::string& what) const {
    if (!result) {
        const auto error = result.error();
        const auto message = what + " failed: " + describe(error);
        if (is_connection_error(error)) {
            throw BackendConnectionError(message);
        }
        throw BackendError(message);
    }
    if (result->status < 200 || result->status >= 300) {
        throw_for_status(result->status, result->body, what);
    }
    if (result->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(result->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError(what + " returned invalid JSON: " + ex.what());
    }
}

nlohmann::json BackendClient::get_json(const std::string& path) {
    const auto full_path = build_path(path);
    auto client = make_client();
    return handle_response(client->Get(full_path, make_headers("application/json")),
                           "GET " + full_path);
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    auto client = make_client();
    return handle_response(client->Post(full_path, make_headers("application/json"), body.dump(),
                                        "application/json"),
                           "POST " + full_path);
}

nlohmann::json BackendClient::delete_json(const std::string& path) {
    const auto full_path = build_path(path);
    auto client = make_client();
    return handle_response(client->Delete(full_path, make_headers("application/json")),
                           "DELETE " + full_path);
}

bool BackendClient::post_stream(const std::string& path,
                                const nlohmann::json& body,
                                const std::string& accept,
                                const ChunkHandler& on_chunk) {
    const auto full_path = build_path(path);
    auto client = make_client();

    int status = 0;
    bool aborted = false;
    std::string error_body;

    httplib::Request request;
    request.method = "POST";
    request.path = full_path;
    request.headers = make_headers(accept);
    request.body = body.dump();
    request.set_header("Content-Type", "application/json");
    request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    request.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (status < 200 || status >= 300) {
            error_body.append(data, length);
            return true;
        }
        if (!on_chunk(data, length)) {
            aborted = true;
            return false;
        }
        return true;
    };

    const auto result = client->send(request);
    if (aborted) {
        return false;
    }
    if (!result) {
        const auto error = result.error();
        const auto message = "POST " + full_path + " failed: " + describe(error);
        if (is_connection_error(error)) {
            throw BackendConnectionError(message);
        }
        throw BackendError(message);
    }
    if (status < 200 || status >= 300) {
        throw_for_status(status, error_body, "POST " + full_path);
    }
    logging::trace("Streamed request finished", {kv("path", full_path), kv("status", status)});
    return true;
}

}
