#pragma once

#include <string_view>
#include <vector>
#include <variant>
#include <functional>

#include <simdjson.h>

#include "lcr/optional.hpp"


namespace wireio::core::protocol {

// Positional arguments of an inbound event (views into the parser buffer)
using EventArgs = std::vector<simdjson::dom::element>;

// Response carried by an acknowledgement reply; empty when the reply had none
using AckResponse = lcr::optional<simdjson::dom::element>;

using EventCallback = std::function<void(const EventArgs&)>;
using AckCallback   = std::function<void(const AckResponse&)>;


// ["<event>", arg0, arg1, ...]
struct EventMessage {
    std::string_view event;
    EventArgs args;
};

// ["ACK", "<id>", <response>]
struct AckMessage {
    std::string_view ack_id;
    AckResponse response;
};

// Decided once by the router; consumers visit it exhaustively.
using Message = std::variant<EventMessage, AckMessage>;

} // namespace wireio::core::protocol
