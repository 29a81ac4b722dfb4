#pragma once

#include <string>
#include <string_view>

#include "wireio/core/config/protocol.hpp"


// ----------------------------------------------------------------------------
// Inbound frame builders
// ----------------------------------------------------------------------------

namespace frames {

// 42["<event>"<, args_json>]   (args_json is a comma separated JSON list)
inline std::string event(std::string_view name, std::string_view args_json = {}) {
    std::string out = "42[\"" + std::string(name) + "\"";
    if (!args_json.empty()) {
        out += ",";
        out += args_json;
    }
    out += "]";
    return out;
}

// 42["ACK","<id>"<, response_json>]
inline std::string ack(std::string_view id, std::string_view response_json = {}) {
    std::string out = "42[\"ACK\",\"" + std::string(id) + "\"";
    if (!response_json.empty()) {
        out += ",";
        out += response_json;
    }
    out += "]";
    return out;
}

// Extracts <id> from an outbound "\"ACK:<id>\"" marker argument (empty if not a marker)
inline std::string ack_id_from_marker(std::string_view encoded) {
    const std::string prefix = "\"" + std::string(wireio::core::config::protocol::ACK_MARKER_PREFIX);
    if (encoded.size() < prefix.size() + 1 || encoded.substr(0, prefix.size()) != prefix || encoded.back() != '"') {
        return {};
    }
    return std::string(encoded.substr(prefix.size(), encoded.size() - prefix.size() - 1));
}

} // namespace frames
