/*
===============================================================================
wireio Session
===============================================================================

Client side of one logical connection speaking the `42[...]` event protocol
on top of a pluggable engine.

Architecture:
  - Engine (EngineConcept) → connection, handshake, heartbeat, outbound framing
  - protocol::Codec        → frame → Packet
  - protocol::Router       → Packet payload → Message (Event | Ack)
  - protocol::ack          → pending acknowledgement callbacks
  - protocol::event        → named event listeners

The Session:
  - Owns the engine and both registries (no process-wide state, so several
    sessions can coexist)
  - Pulls exactly one frame per read() and dispatches it synchronously
  - Tags outbound calls that expect a reply with a trailing "ACK:<id>" argument
  - Closes the engine on destruction if still connected

State machine:

    Disconnected --initialize()--> Connected --close()--> Disconnected

close() is idempotent. Packet errors are returned to the caller and never
change the connection state.

Threading:
  Single-threaded and blocking. Callbacks run on the read() caller's thread.
  Message views passed to callbacks are only valid during the callback.
===============================================================================
*/

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <concepts>

#include "wireio/core/error.hpp"
#include "wireio/core/config/protocol.hpp"
#include "wireio/core/transport/state.hpp"
#include "wireio/core/transport/engine_concept.hpp"
#include "wireio/core/protocol/arguments.hpp"
#include "wireio/core/protocol/message.hpp"
#include "wireio/core/protocol/packet.hpp"
#include "wireio/core/protocol/codec.hpp"
#include "wireio/core/protocol/router.hpp"
#include "wireio/core/protocol/ack/registry.hpp"
#include "wireio/core/protocol/event/listeners.hpp"
#include "lcr/log/logger.hpp"


namespace wireio::core {

template<transport::EngineConcept Engine>
class Session {

public:
    Session() requires std::default_initializable<Engine> = default;

    explicit Session(Engine engine)
        : engine_(std::move(engine))
    {
    }

    // Registries hold callbacks that may capture the session by reference
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    ~Session() {
        if (state_ == transport::State::Connected) {
            close();
        }
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Connect the engine. Any engine failure is reported as ConnectionFailed;
    // the caller decides whether to retry.
    [[nodiscard]]
    inline Error initialize() noexcept {
        if (state_ == transport::State::Connected) {
            WIO_WARN("[SESSION] initialize() called while already connected -> ignore.");
            return Error::InvalidState;
        }

        WIO_DEBUG("[SESSION] Connecting to the server");
        const Error err = engine_.connect();
        if (err != Error::None) {
            WIO_ERROR("[SESSION] Could not connect to the server: " << err);
            return Error::ConnectionFailed;
        }

        state_ = transport::State::Connected;
        WIO_DEBUG("[SESSION] Connected to the server");
        return Error::None;
    }

    // Close the engine. No-op when already disconnected.
    inline void close() noexcept {
        if (state_ == transport::State::Disconnected) {
            return;
        }
        WIO_DEBUG("[SESSION] Closing the connection");
        engine_.close();
        state_ = transport::State::Disconnected;
    }

    // -------------------------------------------------------------------------
    // Inbound
    // -------------------------------------------------------------------------

    // Read, decode and dispatch exactly one frame.
    [[nodiscard]]
    inline Error read() {
        WIO_TRACE("[SESSION] Reading a new frame from the engine");

        frame_.clear();
        const Error err = engine_.read(frame_);
        if (err != Error::None) {
            WIO_DEBUG("[SESSION] Engine read failed: " << err);
            return err;
        }
        return handle_frame_(frame_);
    }

    // Blocking loop: reads until the first error of any kind, which is
    // returned. Malformed frames stop the loop just like a closed engine.
    inline Error listen() {
        WIO_DEBUG("[SESSION] Listening");
        Error err = Error::None;
        do {
            err = read();
        } while (err == Error::None);
        WIO_DEBUG("[SESSION] Listen loop stopped: " << err);
        return err;
    }

    // -------------------------------------------------------------------------
    // Outbound
    // -------------------------------------------------------------------------

    // Emit an event. When `ack` is set it is registered and "ACK:<id>" is
    // appended as the last argument so the server replies with that id.
    // Returns false if the engine refused the message.
    inline bool emit(std::string_view event, protocol::Arguments args, protocol::AckCallback ack = {}) {
        const bool expects_ack = static_cast<bool>(ack);

        std::string ack_id;
        if (expects_ack) {
            ack_id = acks_.add(std::move(ack));

            std::string marker;
            marker.reserve(config::protocol::ACK_MARKER_PREFIX.size() + ack_id.size());
            marker += config::protocol::ACK_MARKER_PREFIX;
            marker += ack_id;
            args.push(marker);
        }

        WIO_DEBUG("[SESSION] Sending a new message {event=" << event << ", args=" << args << "}");

        if (!engine_.emit(event, args, expects_ack)) {
            WIO_WARN("[SESSION] Engine refused message {event=" << event << "}");
            if (expects_ack) {
                // Nobody will ever answer a message that was not sent
                (void)acks_.remove(ack_id);
            }
            return false;
        }
        return true;
    }

    // Register the handler for `event`, replacing any previous one.
    inline Session& on(std::string event, protocol::EventCallback cb) {
        WIO_DEBUG("[SESSION] Registering listener {" << event << "}");
        listeners_.on(std::move(event), std::move(cb));
        return *this;
    }

    // Set the namespace used by the engine for subsequent messages.
    inline Session& of(std::string_view ns) {
        WIO_DEBUG("[SESSION] Setting the namespace {" << ns << "}");
        engine_.of(ns);
        return *this;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline transport::State state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return state_ == transport::State::Connected;
    }

    [[nodiscard]]
    inline std::size_t pending_acks() const noexcept {
        return acks_.count();
    }

    [[nodiscard]]
    inline const protocol::event::Listeners& listeners() const noexcept {
        return listeners_;
    }

    // Direct engine access for advanced use (and tests)
    [[nodiscard]]
    inline Engine& engine() noexcept {
        return engine_;
    }

    [[nodiscard]]
    inline const Engine& engine() const noexcept {
        return engine_;
    }

private:
    Engine engine_;
    transport::State state_{transport::State::Disconnected};

    protocol::Codec codec_;
    protocol::ack::Registry acks_;
    protocol::event::Listeners listeners_;

    // Reused receive buffer
    std::string frame_;

private:

    [[nodiscard]]
    inline Error handle_frame_(std::string_view frame) {
        WIO_TRACE("[SESSION] Frame: " << frame);

        protocol::Packet packet;
        Error err = codec_.decode(frame, packet);
        if (err != Error::None) {
            return err;
        }
        if (!packet.present) {
            return Error::None;
        }

        protocol::Message msg;
        err = protocol::Router::route(packet.payload, msg);
        if (err != Error::None) {
            return err;
        }

        std::visit([this](const auto& m) { dispatch_(m); }, msg);
        return Error::None;
    }

    inline void dispatch_(const protocol::AckMessage& msg) {
        WIO_TRACE("[SESSION] Acknowledgement {" << msg.ack_id << "}");
        (void)acks_.resolve(msg.ack_id, msg.response);
    }

    inline void dispatch_(const protocol::EventMessage& msg) {
        WIO_TRACE("[SESSION] Event {" << msg.event << "} with " << msg.args.size() << " arg(s)");
        (void)listeners_.trigger(msg.event, msg.args);
    }
};

} // namespace wireio::core
