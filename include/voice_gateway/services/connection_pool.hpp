#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

// Bounded set of service clients shared by all sessions. Waiters are admitted
// in arrival order; a waiter that is not served within the acquire timeout
// gets PoolTimeout.
template <typename Client>
class ConnectionPool {
    struct Shared {
        std::string name;
        size_t capacity = 0;
        std::chrono::milliseconds acquire_timeout{0};
        std::function<std::unique_ptr<Client>()> factory;

        std::mutex mutex;
        std::condition_variable cv;
        std::vector<std::unique_ptr<Client>> idle;
        std::deque<uint64_t> waiters;
        uint64_t next_ticket = 0;
        size_t in_use = 0;

        void give_back(std::unique_ptr<Client> client) {
            std::lock_guard<std::mutex> lock(mutex);
            if (client) {
                idle.push_back(std::move(client));
            }
            --in_use;
            cv.notify_all();
        }
    };

public:
    using Factory = std::function<std::unique_ptr<Client>()>;

    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept
            : shared_(std::move(other.shared_)), client_(std::move(other.client_)) {}
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                shared_ = std::move(other.shared_);
                client_ = std::move(other.client_);
            }
            return *this;
        }

        Client* get() const { return client_.get(); }
        Client* operator->() const { return client_.get(); }
        Client& operator*() const { return *client_; }
        explicit operator bool() const { return static_cast<bool>(client_); }

        // The client is broken; drop it instead of returning it to the pool.
        void invalidate() { client_.reset(); }

        void release() {
            if (shared_) {
                shared_->give_back(std::move(client_));
                shared_.reset();
            }
        }

    private:
        friend class ConnectionPool;
        Lease(std::shared_ptr<Shared> shared, std::unique_ptr<Client> client)
            : shared_(std::move(shared)), client_(std::move(client)) {}

        std::shared_ptr<Shared> shared_;
        std::unique_ptr<Client> client_;
    };

    ConnectionPool(std::string name,
                   size_t capacity,
                   std::chrono::milliseconds acquire_timeout,
                   Factory factory)
        : shared_(std::make_shared<Shared>()) {
        shared_->name = std::move(name);
        shared_->capacity = capacity == 0 ? 1 : capacity;
        shared_->acquire_timeout = acquire_timeout;
        shared_->factory = std::move(factory);
    }

    Lease acquire(const utils::CancellationToken& token = {}) {
        auto shared = shared_;
        auto wake = token.on_cancel([shared] {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->cv.notify_all();
        });

        std::unique_lock<std::mutex> lock(shared->mutex);
        const auto ticket = shared->next_ticket++;
        shared->waiters.push_back(ticket);
        const auto deadline = std::chrono::steady_clock::now() + shared->acquire_timeout;
        const bool admitted = shared->cv.wait_until(lock, deadline, [&] {
            return token.is_cancelled() ||
                   (shared->waiters.front() == ticket && shared->in_use < shared->capacity);
        });

        auto position = std::find(shared->waiters.begin(), shared->waiters.end(), ticket);
        if (position != shared->waiters.end()) {
            shared->waiters.erase(position);
        }
        if (!admitted || token.is_cancelled()) {
            shared->cv.notify_all();
            if (token.is_cancelled()) {
                throw OperationCancelled();
            }
            logging::warn("Connection pool exhausted",
                          {kv("pool", shared->name),
                           kv("capacity", shared->capacity),
                           kv("waiting", shared->waiters.size())});
            throw PoolTimeout(shared->name + " pool acquire timed out");
        }

        ++shared->in_use;
        std::unique_ptr<Client> client;
        if (!shared->idle.empty()) {
            client = std::move(shared->idle.back());
            shared->idle.pop_back();
        }
        shared->cv.notify_all();
        lock.unlock();

        if (!client) {
            try {
                client = shared->factory();
            } catch (...) {
                shared->give_back(nullptr);
                throw;
            }
        }
        return Lease(shared, std::move(client));
    }

    size_t in_use() const {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        return shared_->in_use;
    }

    size_t capacity() const { return shared_->capacity; }

private:
    std::shared_ptr<Shared> shared_;
};

}
