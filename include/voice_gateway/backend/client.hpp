#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace voice_gateway {

struct BackendRequestOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{60000};
    std::chrono::milliseconds write_timeout{60000};
};

// JSON over HTTP(S) with bearer authorization. Every request uses its own
// connection, so one instance can serve several sessions at once.
//
// Throws BackendConnectionError when the server cannot be reached (or answers
// 502/503/504), BackendPermissionError on 401/403 and BackendError otherwise.
class BackendClient {
public:
    // Receives body bytes of a streamed response; return false to abort.
    using ChunkHandler = std::function<bool(const char* data, size_t length)>;

    BackendClient(std::string base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json delete_json(const std::string& path);

    // POSTs `body` and hands the response body to `on_chunk` as it arrives.
    // Returns false when the handler aborted the transfer.
    bool post_stream(const std::string& path,
                     const nlohmann::json& body,
                     const std::string& accept,
                     const ChunkHandler& on_chunk);

    const std::string& base_url() const { return base_url_; }

private:
    std::unique_ptr<httplib::Client> make_client() const;
    httplib::Headers make_headers(const std::string& accept) const;
    std::string build_path(const std::string& path) const;
    nlohmann::json handle_response(const httplib::Result& result, const std::string& what) const;

    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_ = 80;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
};

// Maps an HTTP status of a failed request to the matching exception.
[[noreturn]] void throw_for_status(int status, const std::string& body, const std::string& what);

}
