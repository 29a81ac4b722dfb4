#pragma once

#include <simdjson.h>


namespace wireio::core::protocol {

// -----------------------------------------------------------------------------
// One decoded frame.
//
// `payload` is a view into the codec's parser buffer: it stays valid only
// until the next decode on the same codec.
// -----------------------------------------------------------------------------
struct Packet {
    bool present = false;             // false for an empty frame (no packet)
    int code = 0;
    simdjson::dom::element payload{};
};

} // namespace wireio::core::protocol
