/*
===============================================================================
EngineConcept (Blocking, Pull-Based)
===============================================================================

Defines the minimal contract the Session requires from the engine that owns
the underlying connection.

The engine implementation:

  • Establishes the connection (handshake, heartbeat, reconnection are its own)
  • Blocks in read() until one complete text frame is available
  • Encodes and sends outbound events (framing is entirely its concern)
  • Carries the namespace context used for subsequent emits

The Session never touches sockets or wire bytes for outbound traffic; it only
decides *what* to emit.

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Single caller thread. Every call runs to completion before returning.

===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "wireio/core/error.hpp"
#include "wireio/core/protocol/arguments.hpp"


namespace wireio::core::transport {

template<class E>
concept EngineConcept =
    requires(
        E e,
        std::string& frame,
        std::string_view event,
        const protocol::Arguments& args,
        bool expects_ack,
        std::string_view ns
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { e.connect() } noexcept -> std::same_as<Error>;
    { e.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Receiving (blocks for exactly one frame)
    // ---------------------------------------------------------------------

    { e.read(frame) } noexcept -> std::same_as<Error>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { e.emit(event, args, expects_ack) } noexcept -> std::same_as<bool>;
    { e.of(ns) } noexcept -> std::same_as<void>;
};

} // namespace wireio::core::transport
