#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace wireio::core {

/*
===============================================================================
 wireio::core::Error
===============================================================================

Closed error classification shared by the engine contract, the codec, the
router and the session.

Connection-level errors come from the engine; packet-level errors come from
decoding and routing. Neither kind changes the connection state by itself:
higher layers (or the application) decide what to do.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Engine / connection ------------------------------------------------
    ConnectionFailed,      // Engine could not establish the connection
    InvalidState,          // Engine operation not allowed in its current state
    RemoteClosed,          // Peer closed the connection (no more frames)
    TransportFailure,      // Unclassified engine read failure

    // --- Packet -------------------------------------------------------------
    MalformedPacket,       // Missing separator, bad code, invalid JSON or payload shape
    UnsupportedPacketCode  // Well-formed numeric code this layer does not handle
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                  return "None";
    case Error::ConnectionFailed:      return "ConnectionFailed";
    case Error::InvalidState:          return "InvalidState";
    case Error::RemoteClosed:          return "RemoteClosed";
    case Error::TransportFailure:      return "TransportFailure";
    case Error::MalformedPacket:       return "MalformedPacket";
    case Error::UnsupportedPacketCode: return "UnsupportedPacketCode";
    default:                           return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Error err) {
    return os << to_string(err);
}

} // namespace wireio::core
