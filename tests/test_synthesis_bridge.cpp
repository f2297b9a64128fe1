#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_gateway/pipeline/egress_scheduler.hpp"
#include "voice_gateway/pipeline/synthesis_bridge.hpp"

#include <atomic>
#include <string>
#include <vector>

using namespace voice_gateway;
using voice_gateway::testing::FakeServices;
using voice_gateway::testing::FakeTransport;
using voice_gateway::testing::eventually;

namespace {

const std::map<std::string, std::string> kVoices = {
    {"en-US", "voice-en-us"},
    {"en-GB", "voice-en-gb"},
    {"de-DE", "voice-de"},
};

struct BridgeHarness {
    explicit BridgeHarness(size_t samples_per_unit) {
        fakes.synthesis->samples_per_unit = samples_per_unit;
        fakes.synthesis->chunk_samples = 200;
        egress.set_turn_callbacks(nullptr, [this](uint64_t turn) { drained = turn; });
    }

    FakeServices fakes;
    FakeTransport transport;
    utils::CancellationSource session;
    VoiceSelector voices{kVoices, "en-US", "auto"};
    EgressScheduler egress{"s1", transport, 64, session.token()};
    SynthesisBridge bridge{"s1", SynthesisBridge::Options{16000, 20, 16},
                           fakes.services().synthesis_pool, voices, egress, session.token()};
    std::atomic<uint64_t> drained{0};
};

}

TEST_CASE("voices follow the session language") {
    VoiceSelector fixed(kVoices, "en-US", "de-DE");
    fixed.set_detected_language("en-GB");
    REQUIRE(fixed.select().voice == "voice-de");
    REQUIRE(fixed.select().language == "de-DE");
}

TEST_CASE("auto sessions follow the detected language") {
    VoiceSelector selector(kVoices, "en-US", "auto");
    REQUIRE(selector.select().voice == "voice-en-us");

    selector.set_detected_language("en-GB");
    REQUIRE(selector.select().voice == "voice-en-gb");

    // A bare or regional tag falls back to any voice of its base language.
    selector.set_detected_language("de");
    REQUIRE(selector.select().voice == "voice-de");
    selector.set_detected_language("de-AT");
    REQUIRE(selector.select().language == "de-DE");

    selector.set_detected_language("ja-JP");
    REQUIRE(selector.select().voice == "voice-en-us");

    selector.set_detected_language("");
    REQUIRE(selector.select().voice == "voice-en-us");
}

TEST_CASE("no configured voice leaves the choice to the service") {
    VoiceSelector selector({}, "en-US", "auto");
    const auto selection = selector.select();
    REQUIRE(selection.voice.empty());
    REQUIRE(selection.language == "en-US");
}

TEST_CASE("synthesized audio is cut into fixed frames") {
    BridgeHarness harness(500);
    harness.egress.start();
    harness.bridge.start();

    REQUIRE(harness.bridge.enqueue(1, "Hello.", harness.session.token()));
    harness.bridge.finish_turn(1);
    REQUIRE(eventually([&] { return harness.drained.load() == 1; }));

    const auto frames = harness.transport.frames();
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0].samples.size() == 320);
    REQUIRE(frames[0].direction == Direction::Outbound);
    REQUIRE(frames[1].samples.size() == 320);
    REQUIRE(frames[1].samples[179] == 100);
    REQUIRE(frames[1].samples[180] == 0);
    REQUIRE(frames[1].sequence > frames[0].sequence);

    std::lock_guard<std::mutex> lock(harness.fakes.synthesis->mutex);
    REQUIRE(harness.fakes.synthesis->requests[0].voice == "voice-en-us");
    REQUIRE(harness.fakes.synthesis->requests[0].sample_rate == 16000);
}

TEST_CASE("a failed unit is skipped and the reply goes on") {
    BridgeHarness harness(640);
    harness.fakes.synthesis->failing_texts = {"Broken."};
    harness.egress.start();
    harness.bridge.start();

    harness.bridge.enqueue(1, "Broken.", harness.session.token());
    harness.bridge.enqueue(1, "Fine.", harness.session.token());
    harness.bridge.finish_turn(1);

    REQUIRE(eventually([&] { return harness.drained.load() == 1; }));
    REQUIRE(harness.fakes.synthesis->texts() == std::vector<std::string>{"Broken.", "Fine."});
    REQUIRE(harness.transport.frames_sent() == 2);
}

TEST_CASE("cancelling a turn drops its pending units") {
    BridgeHarness harness(640);
    harness.bridge.enqueue(1, "First.", harness.session.token());
    harness.bridge.enqueue(1, "Second.", harness.session.token());

    harness.bridge.cancel_turn(1);
    REQUIRE_FALSE(harness.bridge.enqueue(1, "Late.", harness.session.token()));

    harness.egress.start();
    harness.bridge.start();
    harness.bridge.enqueue(2, "Next.", harness.session.token());
    harness.bridge.finish_turn(2);

    REQUIRE(eventually([&] { return harness.drained.load() == 2; }));
    REQUIRE(harness.fakes.synthesis->texts() == std::vector<std::string>{"Next."});
}
