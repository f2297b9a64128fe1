#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway::utils {

// Blocking FIFO with a fixed capacity. `push` blocks while the queue is full,
// `pop` while it is empty; both give up on cancellation or close().
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool push(T item, const CancellationToken& token = {}) {
        auto wake = token.on_cancel([this] { notify_all(); });
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [&] {
            return closed_ || token.is_cancelled() || items_.size() < capacity_;
        });
        if (closed_ || token.is_cancelled()) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    bool try_push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.size() >= capacity_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Returns nullopt on cancellation, or once the queue is closed and drained.
    std::optional<T> pop(const CancellationToken& token = {}) {
        auto wake = token.on_cancel([this] { notify_all(); });
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [&] {
            return closed_ || token.is_cancelled() || !items_.empty();
        });
        return take_locked(token);
    }

    std::optional<T> pop_for(std::chrono::milliseconds timeout,
                             const CancellationToken& token = {}) {
        auto wake = token.on_cancel([this] { notify_all(); });
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [&] {
            return closed_ || token.is_cancelled() || !items_.empty();
        });
        return take_locked(token);
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked({});
    }

    template <typename Predicate>
    size_t remove_if(Predicate predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = items_.begin(); it != items_.end();) {
            if (predicate(*it)) {
                it = items_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            not_full_.notify_all();
        }
        return removed;
    }

    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto removed = items_.size();
        items_.clear();
        not_full_.notify_all();
        return removed;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    void notify_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    std::optional<T> take_locked(const CancellationToken& token) {
        if (token.is_cancelled() || items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}
