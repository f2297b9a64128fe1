#include "voice_gateway/backend/http_synthesis_client.hpp"

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/async.hpp"

namespace voice_gateway {

struct HttpSynthesisClient::Job {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<int16_t>> chunks;
    std::string carry;
    bool done = false;
    std::optional<std::string> error;
    std::atomic<bool> cancelled{false};

    // Appends raw bytes; an odd trailing byte waits for the next chunk.
    void append(const char* data, size_t length) {
        carry.append(data, length);
        const size_t usable = carry.size() - carry.size() % sizeof(int16_t);
        if (usable == 0) {
            return;
        }
        std::vector<int16_t> samples(usable / sizeof(int16_t));
        std::memcpy(samples.data(), carry.data(), usable);
        carry.erase(0, usable);
        std::lock_guard<std::mutex> lock(mutex);
        chunks.push_back(std::move(samples));
        cv.notify_all();
    }

    void finish(std::optional<std::string> failure) {
        std::lock_guard<std::mutex> lock(mutex);
        done = true;
        error = std::move(failure);
        cv.notify_all();
    }
};

HttpSynthesisClient::HttpSynthesisClient(Options options)
    : client_(std::make_shared<BackendClient>(options.base_url, options.authorization_token,
                                              options.request)) {}

HttpSynthesisClient::~HttpSynthesisClient() {
    cancel();
}

void HttpSynthesisClient::start(const SynthesisRequest& request) {
    cancel();
    auto job = std::make_shared<Job>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job_ = job;
    }
    const nlohmann::json body = {
        {"text", request.text},
        {"voice", request.voice},
        {"language", request.language},
        {"sample_rate", request.sample_rate},
    };
    utils::run_async([client = client_, job, body]() {
        try {
            client->post_stream("/synthesize", body, "audio/pcm",
                                [&job](const char* data, size_t length) {
                                    if (job->cancelled.load()) {
                                        return false;
                                    }
                                    job->append(data, length);
                                    return true;
                                });
            job->finish(std::nullopt);
        } catch (const std::exception& ex) {
            job->finish(std::string(ex.what()));
        }
    });
}

std::optional<std::vector<int16_t>> HttpSynthesisClient::next_increment(
    const utils::CancellationToken& token) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = job_;
    }
    if (!job) {
        return std::nullopt;
    }
    auto wake = token.on_cancel([job]() {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->cv.notify_all();
    });
    std::unique_lock<std::mutex> lock(job->mutex);
    job->cv.wait(lock, [&] {
        return token.is_cancelled() || job->cancelled.load() || !job->chunks.empty() || job->done;
    });
    if (token.is_cancelled() || job->cancelled.load()) {
        return std::nullopt;
    }
    if (!job->chunks.empty()) {
        auto chunk = std::move(job->chunks.front());
        job->chunks.pop_front();
        return chunk;
    }
    if (job->error) {
        throw SynthesisFailure(*job->error);
    }
    return std::nullopt;
}

void HttpSynthesisClient::cancel() {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = std::move(job_);
        job_.reset();
    }
    if (!job) {
        return;
    }
    job->cancelled.store(true);
    std::lock_guard<std::mutex> lock(job->mutex);
    job->cv.notify_all();
}

}
