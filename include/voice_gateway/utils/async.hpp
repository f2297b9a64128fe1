#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {
namespace utils {

void run_async(std::function<void()> task);

// Runs a blocking call on a detached worker and waits for it until the
// deadline passes or the token is cancelled. The worker owns everything it
// touches, so abandoning it is safe.
template <typename Fn>
auto run_with_deadline(Fn fn,
                       std::chrono::milliseconds deadline,
                       const CancellationToken& token,
                       const std::string& what) -> decltype(fn()) {
    using Result = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    auto future = task->get_future();
    run_async([task]() { (*task)(); });

    const auto until = std::chrono::steady_clock::now() + deadline;
    const std::chrono::milliseconds slice(20);
    while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        token.throw_if_cancelled();
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) {
            throw DeadlineExceeded(what + " timed out");
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
        future.wait_for(std::min(slice, remaining));
    }
    return future.get();
}

}
}
