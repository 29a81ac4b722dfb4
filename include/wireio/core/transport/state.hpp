#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace wireio::core::transport {

// ===============================================================
// SESSION CONNECTION STATE
// ===============================================================
enum class State : std::uint8_t {
    Disconnected,
    Connected
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected: return "Disconnected";
        case State::Connected:    return "Connected";
        default:                  return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, State s) {
    return os << to_string(s);
}

} // namespace wireio::core::transport
