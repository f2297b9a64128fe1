#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace voice_gateway::utils {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
    std::map<uint64_t, std::function<void()>> callbacks;
    uint64_t next_id = 1;
};

}

// Unregisters its callback on destruction. Once the destructor returns the
// callback is not running and will never run.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void reset();

private:
    std::shared_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

// Read side of a cancellation source. A default constructed token is never
// cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;
    void throw_if_cancelled() const;

    // Sleeps up to `timeout`; returns true when woken by cancellation.
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Runs `callback` once on cancellation, immediately when already cancelled.
    CancellationRegistration on_cancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();
    // Linked source: cancelled together with `parent`, never the other way round.
    explicit CancellationSource(const CancellationToken& parent);

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationToken token() const;
    void cancel();
    bool is_cancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
    CancellationRegistration parent_link_;
};

}
