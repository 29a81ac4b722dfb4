#pragma once

#include <string>
#include <chrono>
#include <cstdint>

#include "wireio/core/config/protocol.hpp"
#include "lcr/json.hpp"
#include "lcr/sequence.hpp"


namespace wireio::core::protocol::ack {

// -----------------------------------------------------------------------------
// Correlation id generator
//
//   <13 hex digits: wall-clock microseconds><hex sequence>
//
// The time prefix keeps ids distinct across sessions and restarts; the
// per-generator sequence keeps them distinct within the same microsecond.
// Not thread-safe (one generator per session).
// -----------------------------------------------------------------------------
class IdGenerator {
public:
    IdGenerator() = default;

    [[nodiscard]]
    inline std::string next() {
        using namespace std::chrono;
        const auto us = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();

        std::string id;
        id.reserve(config::protocol::ACK_ID_TIME_DIGITS + 16);
        lcr::json::append_hex(id, static_cast<std::uint64_t>(us), config::protocol::ACK_ID_TIME_DIGITS);
        lcr::json::append_hex(id, seq_.next());
        return id;
    }

    // Number of ids handed out so far
    [[nodiscard]]
    inline std::uint64_t issued() const noexcept {
        return seq_.current() - 1;
    }

private:
    lcr::sequence seq_{1};
};

} // namespace wireio::core::protocol::ack
