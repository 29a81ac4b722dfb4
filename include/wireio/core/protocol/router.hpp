#pragma once

#include <string_view>
#include <utility>

#include <simdjson.h>

#include "wireio/core/error.hpp"
#include "wireio/core/config/protocol.hpp"
#include "wireio/core/protocol/message.hpp"
#include "lcr/log/logger.hpp"


namespace wireio::core::protocol {

/*
================================================================================
Router
================================================================================

Turns the JSON payload of an event packet into a typed Message.

Element 0 decides the kind:

  ["ACK", "<id>", <response>]   → AckMessage   (missing response is allowed)
  ["<event>", arg0, arg1, ...]  → EventMessage (args keep their order)

The "ACK" sentinel is a convention of this client, mirrored by the marker it
appends to outbound calls. It is not part of any universal wire format.

The router performs no dispatch and owns no state: it only classifies.
================================================================================
*/

class Router {
public:
    [[nodiscard]]
    static inline Error route(const simdjson::dom::element& payload, Message& out) noexcept {
        simdjson::dom::array items;
        if (payload.get(items)) {
            WIO_WARN("[ROUTER] Payload is not a JSON array -> drop.");
            return Error::MalformedPacket;
        }

        simdjson::dom::element head;
        if (items.at(0).get(head)) {
            WIO_WARN("[ROUTER] Empty payload array -> drop.");
            return Error::MalformedPacket;
        }

        std::string_view name;
        if (head.get(name)) {
            WIO_WARN("[ROUTER] Payload element 0 is not a string -> drop.");
            return Error::MalformedPacket;
        }

        if (name == config::protocol::ACK_SENTINEL) {
            return route_ack_(items, out);
        }
        return route_event_(name, items, out);
    }

private:
    [[nodiscard]]
    static inline Error route_ack_(const simdjson::dom::array& items, Message& out) noexcept {
        AckMessage msg;

        simdjson::dom::element id;
        if (items.at(1).get(id) || id.get(msg.ack_id)) {
            WIO_WARN("[ROUTER] Acknowledgement without a string id -> drop.");
            return Error::MalformedPacket;
        }

        simdjson::dom::element response;
        if (!items.at(2).get(response)) {
            msg.response = response;
        }

        out = std::move(msg);
        return Error::None;
    }

    [[nodiscard]]
    static inline Error route_event_(std::string_view name, const simdjson::dom::array& items, Message& out) noexcept {
        EventMessage msg;
        msg.event = name;
        msg.args.reserve(items.size() - 1);

        bool first = true;
        for (simdjson::dom::element item : items) {
            if (first) {
                first = false;
                continue;
            }
            msg.args.push_back(item);
        }

        out = std::move(msg);
        return Error::None;
    }
};

} // namespace wireio::core::protocol
