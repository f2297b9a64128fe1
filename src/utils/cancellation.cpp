#include "voice_gateway/utils/cancellation.hpp"

#include <thread>
#include <utility>

#include "voice_gateway/errors.hpp"

namespace voice_gateway::utils {

namespace {

void cancel_state(const std::shared_ptr<detail::CancellationState>& state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    if (state->cancelled.exchange(true)) {
        return;
    }
    state->cv.notify_all();
    // Callbacks run under the state mutex so that unregistration waits for them.
    auto callbacks = std::move(state->callbacks);
    state->callbacks.clear();
    for (auto& item : callbacks) {
        item.second();
    }
}

}

CancellationRegistration::CancellationRegistration(
    std::shared_ptr<detail::CancellationState> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(
    CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::is_cancelled() const {
    return state_ && state_->cancelled.load();
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw OperationCancelled();
    }
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const {
    if (!state_) {
        return {};
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            const auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }
    callback();
    return {};
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<detail::CancellationState>()) {
    std::weak_ptr<detail::CancellationState> weak = state_;
    parent_link_ = parent.on_cancel([weak] {
        if (auto state = weak.lock()) {
            cancel_state(state);
        }
    });
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

void CancellationSource::cancel() {
    cancel_state(state_);
}

bool CancellationSource::is_cancelled() const {
    return state_->cancelled.load();
}

}
