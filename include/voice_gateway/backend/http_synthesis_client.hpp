#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "voice_gateway/backend/client.hpp"
#include "voice_gateway/services/synthesis_client.hpp"

namespace voice_gateway {

// Synthesis over HTTP: POST {base}/synthesize answers with raw PCM16 mono
// audio, consumed chunk by chunk while it downloads.
class HttpSynthesisClient : public SynthesisClient {
public:
    struct Options {
        std::string base_url;
        std::optional<std::string> authorization_token;
        BackendRequestOptions request;
    };

    explicit HttpSynthesisClient(Options options);
    ~HttpSynthesisClient() override;

    void start(const SynthesisRequest& request) override;
    std::optional<std::vector<int16_t>> next_increment(const utils::CancellationToken& token) override;
    void cancel() override;

private:
    struct Job;

    std::shared_ptr<BackendClient> client_;
    std::mutex mutex_;
    std::shared_ptr<Job> job_;
};

}
