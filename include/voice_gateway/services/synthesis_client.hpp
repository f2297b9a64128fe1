#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

struct SynthesisRequest {
    std::string text;
    std::string voice;
    std::string language;
    int sample_rate = 16000;
};

class SynthesisClient {
public:
    virtual ~SynthesisClient() = default;

    virtual void start(const SynthesisRequest& request) = 0;
    // Next chunk of PCM16 mono audio of arbitrary length. Returns nullopt at
    // the end of the unit or on cancellation; throws SynthesisFailure.
    virtual std::optional<std::vector<int16_t>> next_increment(
        const utils::CancellationToken& token) = 0;
    virtual void cancel() = 0;
};

}
