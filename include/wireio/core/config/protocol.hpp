#pragma once

#include <cstddef>
#include <string_view>


namespace wireio::core::config::protocol {

/*
===============================================================================
Wire Protocol Constants
===============================================================================

All framing constants used by the codec, the router and the session live here.
No magic numbers or literals scattered across the codebase.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Inbound framing:  <code>[<json-array>]
// -----------------------------------------------------------------------------
inline constexpr int  EVENT_PACKET_CODE = 42;   // message (4) + event (2)
inline constexpr char PACKET_SEPARATOR  = '[';

// Longest accepted decimal code prefix (keeps the value inside int range)
inline constexpr std::size_t MAX_CODE_DIGITS = 9;

// -----------------------------------------------------------------------------
// Acknowledgement convention
// -----------------------------------------------------------------------------
// Inbound reply:   ["ACK", "<id>", <response>]
// Outbound marker: trailing argument "ACK:<id>"
inline constexpr std::string_view ACK_SENTINEL      = "ACK";
inline constexpr std::string_view ACK_MARKER_PREFIX = "ACK:";

// Correlation id layout: 13 hex digits of wall-clock microseconds + hex sequence
inline constexpr std::size_t ACK_ID_TIME_DIGITS = 13;

} // namespace wireio::core::config::protocol
