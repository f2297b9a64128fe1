#pragma once

#include <optional>
#include <string>

#include "voice_gateway/session/types.hpp"
#include "voice_gateway/utils/cancellation.hpp"

namespace voice_gateway {

class RecognitionClient {
public:
    virtual ~RecognitionClient() = default;

    // Opens a recognition stream. `language` is "auto" or a BCP-47 tag.
    // Throws RecognitionFailure when the service cannot be reached.
    virtual void start(const std::string& language, int sample_rate) = 0;
    virtual void send_audio(const AudioFrame& frame) = 0;
    // Blocks for the next event. Returns nullopt once the stream is closed or
    // the token is cancelled; throws RecognitionFailure on service errors.
    virtual std::optional<RecognitionEvent> next_increment(
        const utils::CancellationToken& token) = 0;
    // Closes the current stream; the client may be started again.
    virtual void cancel() = 0;
};

}
