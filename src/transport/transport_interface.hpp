#pragma once

// ITransport - Abstract per-controller frame link
//
// The coordinator only sees opaque byte frames bounded by maxFrameSize().
// Frames may be dropped, duplicated, reordered or delayed; connection
// changes arrive as events. Implementations: the in-memory SimulatedLink,
// and whatever radio driver the target board provides.

#include "votelink/types.hpp"
#include <string>
#include <utility>

namespace votelink {
namespace transport {

enum class TransportError {
    None,
    NotConnected,        // Controller has no live link right now
    LinkBusy,            // Driver queue full, try again later
    FrameTooLarge,       // Frame exceeds maxFrameSize()
    UnknownController,   // Driver has never seen this controller
};

inline const char* transportErrorToString(TransportError err) {
    switch (err) {
        case TransportError::None:              return "None";
        case TransportError::NotConnected:      return "Not connected";
        case TransportError::LinkBusy:          return "Link busy";
        case TransportError::FrameTooLarge:     return "Frame too large";
        case TransportError::UnknownController: return "Unknown controller";
        default: return "Unknown error";
    }
}

// Inbound event, consumed one at a time by the coordinator loop
struct TransportEvent {
    enum class Type : uint8_t {
        CONNECTED,
        DISCONNECTED,
        FRAME,
    };

    Type type = Type::FRAME;
    ControllerId controller = 0;
    Bytes data;                    // FRAME only

    static TransportEvent connected(ControllerId id) {
        TransportEvent ev;
        ev.type = Type::CONNECTED;
        ev.controller = id;
        return ev;
    }

    static TransportEvent disconnected(ControllerId id) {
        TransportEvent ev;
        ev.type = Type::DISCONNECTED;
        ev.controller = id;
        return ev;
    }

    static TransportEvent frame(ControllerId id, Bytes bytes) {
        TransportEvent ev;
        ev.type = Type::FRAME;
        ev.controller = id;
        ev.data = std::move(bytes);
        return ev;
    }
};

class ITransport {
public:
    virtual ~ITransport() = default;

    // Human-readable name (e.g., "SimulatedLink")
    virtual std::string getName() const = 0;

    // Largest frame the link carries in one unit
    virtual size_t maxFrameSize() const = 0;

    // Fire-and-forget. Success only means the frame was handed to the link;
    // delivery is observed later through an ACK/VOTE or not at all.
    virtual TransportError send(ControllerId controller, ByteSpan frame) = 0;

    // Pop the next inbound event. Returns false when none is pending.
    virtual bool pollEvent(TransportEvent& event) = 0;
};

} // namespace transport
} // namespace votelink
