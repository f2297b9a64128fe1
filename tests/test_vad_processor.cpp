#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/vad/model.hpp"
#include "voice_gateway/vad/processor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <vector>

using Catch::Approx;
using voice_gateway::vad::SpeechModel;
using voice_gateway::vad::StreamingVadProcessor;

namespace {

constexpr size_t kWindow = 512;

// Loud windows are speech, quiet ones are not.
class LoudnessModel : public SpeechModel {
public:
    int sampling_rate() const override { return 16000; }
    size_t window_size() const override { return kWindow; }
    std::vector<float> initialize_state() const override { return {0.0f}; }

    float get_speech_prob(const std::vector<float>& audio, std::vector<float>* state) const override {
        ++calls;
        (*state)[0] += 1.0f;
        float peak = 0.0f;
        for (const auto sample : audio) {
            peak = std::max(peak, std::abs(sample));
        }
        return peak > 0.1f ? 0.9f : 0.05f;
    }

    mutable int calls = 0;
};

std::vector<int16_t> windows(size_t count, bool speech) {
    return std::vector<int16_t>(count * kWindow, speech ? int16_t{16000} : int16_t{0});
}

struct VadHarness {
    // 96 ms of speech to start (3 windows), 160 ms of silence to stop (5 windows).
    VadHarness() : model(std::make_shared<LoudnessModel>()), vad(model, 0.5f, 96, 160, 1) {
        vad.set_on_speech_start([this](double at) { starts.push_back(at); });
        vad.set_on_speech_end([this](double at) { ends.push_back(at); });
    }

    std::shared_ptr<LoudnessModel> model;
    StreamingVadProcessor vad;
    std::vector<double> starts;
    std::vector<double> ends;
};

}

TEST_CASE("speech starts after the minimum duration and stops after enough silence") {
    VadHarness harness;

    harness.vad.process_samples(windows(2, true));
    REQUIRE(harness.starts.empty());
    harness.vad.process_samples(windows(3, true));
    REQUIRE(harness.starts.size() == 1);
    REQUIRE(harness.starts[0] == Approx(3.0 * kWindow / 16000.0));
    REQUIRE(harness.vad.in_speech());

    harness.vad.process_samples(windows(4, false));
    REQUIRE(harness.ends.empty());
    harness.vad.process_samples(windows(2, false));
    REQUIRE(harness.ends.size() == 1);
    REQUIRE(harness.ends[0] == Approx(10.0 * kWindow / 16000.0));
    REQUIRE_FALSE(harness.vad.in_speech());
}

TEST_CASE("short blips never start speech") {
    VadHarness harness;
    for (int i = 0; i < 5; ++i) {
        harness.vad.process_samples(windows(2, true));
        harness.vad.process_samples(windows(1, false));
    }
    REQUIRE(harness.starts.empty());
    REQUIRE(harness.ends.empty());
}

TEST_CASE("a short pause does not end speech") {
    VadHarness harness;
    harness.vad.process_samples(windows(4, true));
    harness.vad.process_samples(windows(3, false));
    harness.vad.process_samples(windows(4, true));
    harness.vad.process_samples(windows(4, false));

    REQUIRE(harness.starts.size() == 1);
    REQUIRE(harness.ends.empty());
    REQUIRE(harness.vad.in_speech());
}

TEST_CASE("samples are buffered until a full window is available") {
    VadHarness harness;
    harness.vad.process_samples(std::vector<int16_t>(300, 16000));
    REQUIRE(harness.model->calls == 0);
    harness.vad.process_samples(std::vector<int16_t>(300, 16000));
    REQUIRE(harness.model->calls == 1);
    harness.vad.process_samples({});
    REQUIRE(harness.model->calls == 1);
}

TEST_CASE("reset forgets a speech segment in progress") {
    VadHarness harness;
    harness.vad.process_samples(windows(4, true));
    REQUIRE(harness.vad.in_speech());

    harness.vad.reset();
    REQUIRE_FALSE(harness.vad.in_speech());
    harness.vad.process_samples(windows(6, false));
    REQUIRE(harness.ends.empty());

    harness.vad.process_samples(windows(2, true));
    REQUIRE(harness.starts.size() == 1);
    harness.vad.process_samples(windows(1, true));
    REQUIRE(harness.starts.size() == 2);
}

TEST_CASE("without a model no boundaries are produced") {
    StreamingVadProcessor vad(nullptr, 0.5f, 96, 160, 1);
    int boundaries = 0;
    vad.set_on_speech_start([&](double) { ++boundaries; });
    vad.process_samples(windows(10, true));
    REQUIRE(boundaries == 0);
    REQUIRE_FALSE(vad.in_speech());
}
