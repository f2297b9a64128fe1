#pragma once

#include <string>

#include "voice_gateway/session/types.hpp"

namespace voice_gateway {

// Duplex audio channel of one caller. Inbound frames and disconnects are
// reported to the SessionManager by the transport itself.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::string id() const = 0;
    // Must not block on the network; may throw TransportLost.
    virtual void send_frame(const AudioFrame& frame) = 0;
    // Drops audio accepted by send_frame that has not been played yet.
    virtual void flush() = 0;
    virtual void close() = 0;
};

}
