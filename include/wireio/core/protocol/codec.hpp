#pragma once

#include <string_view>
#include <charconv>

#include <simdjson.h>

#include "wireio/core/error.hpp"
#include "wireio/core/config/protocol.hpp"
#include "wireio/core/protocol/packet.hpp"
#include "lcr/log/logger.hpp"


namespace wireio::core::protocol {

/*
===============================================================================
Codec
===============================================================================

Decodes one raw text frame of the form

    <code>[<json-array>]

into a Packet (numeric code + JSON payload).

Rules:
  • Empty frame          → no packet (Error::None, out.present == false)
  • No '[' separator     → MalformedPacket
  • Non-decimal code     → MalformedPacket
  • Invalid JSON         → MalformedPacket
  • Code other than 42   → UnsupportedPacketCode

Open / close / ping / pong codes belong to the engine and never reach this
layer; seeing one here is reported, not silently skipped.

Encoding of outbound frames is the engine's job: the codec only decodes.

Ownership:
  The codec owns the simdjson parser. Packet::payload points into its buffer
  and is invalidated by the next decode() call.
===============================================================================
*/

class Codec {
public:
    Codec() = default;

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    [[nodiscard]]
    inline Error decode(std::string_view frame, Packet& out) noexcept {
        out = Packet{};

        if (frame.empty()) {
            return Error::None;
        }

        const auto pos = frame.find(config::protocol::PACKET_SEPARATOR);
        if (pos == std::string_view::npos) {
            WIO_WARN("[CODEC] No code/payload separator in frame: " << frame);
            return Error::MalformedPacket;
        }

        int code = 0;
        if (!parse_code_(frame.substr(0, pos), code)) {
            WIO_WARN("[CODEC] Invalid packet code '" << frame.substr(0, pos) << "' in frame: " << frame);
            return Error::MalformedPacket;
        }

        if (code != config::protocol::EVENT_PACKET_CODE) {
            WIO_WARN("[CODEC] Unhandled packet code " << code);
            return Error::UnsupportedPacketCode;
        }

        const auto body = frame.substr(pos);
        simdjson::dom::element root;
        auto error = parser_.parse(body.data(), body.size()).get(root);
        if (error) {
            WIO_WARN("[CODEC] JSON parse error: " << error << " in frame: " << frame);
            return Error::MalformedPacket;
        }

        out.present = true;
        out.code    = code;
        out.payload = root;
        return Error::None;
    }

private:
    simdjson::dom::parser parser_;

    // Non-empty run of ASCII digits that fits the configured width
    [[nodiscard]]
    static inline bool parse_code_(std::string_view text, int& out) noexcept {
        if (text.empty() || text.size() > config::protocol::MAX_CODE_DIGITS) {
            return false;
        }
        for (char c : text) {
            if (c < '0' || c > '9') {
                return false;
            }
        }
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc{} && ptr == text.data() + text.size();
    }
};

} // namespace wireio::core::protocol
