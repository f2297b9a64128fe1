#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_gateway/pipeline/egress_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

using namespace voice_gateway;
using voice_gateway::testing::FakeTransport;
using voice_gateway::testing::eventually;
using voice_gateway::testing::make_frame;

TEST_CASE("frames reach the transport in order at playback rate") {
    FakeTransport transport;
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 16, session.token());

    std::mutex mutex;
    std::vector<uint64_t> started;
    std::vector<uint64_t> drained;
    egress.set_turn_callbacks(
        [&](uint64_t turn) {
            std::lock_guard<std::mutex> lock(mutex);
            started.push_back(turn);
        },
        [&](uint64_t turn) {
            std::lock_guard<std::mutex> lock(mutex);
            drained.push_back(turn);
        });

    for (uint64_t i = 1; i <= 5; ++i) {
        REQUIRE(egress.push(1, make_frame(i), session.token()));
    }
    egress.mark_turn_complete(1);

    const auto began = std::chrono::steady_clock::now();
    egress.start();
    REQUIRE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return !drained.empty();
    }));
    const auto elapsed = std::chrono::steady_clock::now() - began;
    egress.stop();

    // Five 20 ms frames: the last one leaves 80 ms after the first.
    REQUIRE(elapsed >= std::chrono::milliseconds(75));
    const auto frames = transport.frames();
    REQUIRE(frames.size() == 5);
    for (size_t i = 0; i < frames.size(); ++i) {
        REQUIRE(frames[i].sequence == i + 1);
    }
    REQUIRE(started == std::vector<uint64_t>{1});
    REQUIRE(drained == std::vector<uint64_t>{1});
    REQUIRE(egress.frames_sent() == 5);
}

TEST_CASE("flush drops queued frames and rejects stale turns") {
    FakeTransport transport;
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 16, session.token());

    for (uint64_t i = 1; i <= 4; ++i) {
        REQUIRE(egress.push(3, make_frame(i), session.token()));
    }
    REQUIRE(egress.queued() == 4);

    REQUIRE(egress.flush(3) == 4);
    REQUIRE(egress.queued() == 0);
    REQUIRE_FALSE(egress.push(3, make_frame(5), session.token()));
    REQUIRE_FALSE(egress.push(2, make_frame(6), session.token()));
    REQUIRE(egress.push(4, make_frame(7), session.token()));

    egress.start();
    REQUIRE(eventually([&] { return transport.frames_sent() == 1; }));
    egress.stop();
    REQUIRE(transport.frames()[0].sequence == 7);
}

TEST_CASE("flush also drops audio the transport still buffers") {
    FakeTransport transport;
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 16, session.token());

    egress.push(2, make_frame(1), session.token());
    egress.flush(2);
    REQUIRE(transport.flushes() == 1);
}

TEST_CASE("a frame already taken off the queue is not sent after a flush") {
    FakeTransport transport;
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 16, session.token());
    std::atomic<bool> flushed{false};
    // The first-frame callback runs between dequeue and send.
    egress.set_turn_callbacks(
        [&](uint64_t turn) {
            if (turn == 1) {
                egress.flush(1);
                flushed = true;
            }
        },
        nullptr);

    REQUIRE(egress.push(1, make_frame(1), session.token()));
    REQUIRE(egress.push(1, make_frame(2), session.token()));
    egress.start();
    REQUIRE(eventually([&] { return flushed.load(); }));
    REQUIRE(egress.push(2, make_frame(3), session.token()));
    REQUIRE(eventually([&] { return transport.frames_sent() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    egress.stop();

    const auto frames = transport.frames();
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].sequence == 3);
}

TEST_CASE("a flushed turn never reports drained") {
    FakeTransport transport;
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 16, session.token());
    std::atomic<int> drained{0};
    egress.set_turn_callbacks(nullptr, [&](uint64_t) { ++drained; });

    egress.push(1, make_frame(1), session.token());
    egress.flush(1);
    egress.mark_turn_complete(1);
    egress.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    egress.stop();

    REQUIRE(drained == 0);
    REQUIRE(transport.frames_sent() == 0);
}

TEST_CASE("a turn without audio drains at once") {
    FakeTransport transport;
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 16, session.token());
    std::atomic<uint64_t> drained{0};
    std::atomic<int> started{0};
    egress.set_turn_callbacks([&](uint64_t) { ++started; }, [&](uint64_t turn) { drained = turn; });

    egress.start();
    egress.mark_turn_complete(7);
    REQUIRE(eventually([&] { return drained.load() == 7; }));
    egress.stop();
    REQUIRE(started == 0);
}

TEST_CASE("a lost transport is reported once and stops the scheduler") {
    FakeTransport transport;
    transport.set_lost(true);
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 16, session.token());

    std::atomic<int> errors{0};
    egress.set_error_callback([&](const std::string&) { ++errors; });
    egress.start();
    egress.push(1, make_frame(1), session.token());
    egress.push(1, make_frame(2), session.token());

    REQUIRE(eventually([&] { return errors.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    egress.stop();
    REQUIRE(errors == 1);
    REQUIRE(egress.frames_sent() == 0);
}

TEST_CASE("cancelling the session unblocks a producer waiting on a full queue") {
    FakeTransport transport;
    utils::CancellationSource session;
    EgressScheduler egress("s1", transport, 2, session.token());

    REQUIRE(egress.push(1, make_frame(1), session.token()));
    REQUIRE(egress.push(1, make_frame(2), session.token()));

    std::atomic<bool> pushed{true};
    std::thread producer([&] { pushed = egress.push(1, make_frame(3), session.token()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    session.cancel();
    producer.join();
    REQUIRE_FALSE(pushed);
}
