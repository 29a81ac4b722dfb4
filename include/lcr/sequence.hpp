#pragma once

#include <cstdint>


namespace lcr {


// Monotonic sequence number generator (single-threaded)
class sequence {
    std::uint64_t next_seq_;

public:
    explicit constexpr sequence(std::uint64_t start = 1) noexcept : next_seq_(start) {}
    // Disable copy semantics
    sequence(const sequence&) = delete;
    sequence& operator=(const sequence&) = delete;
    // Enable move semantics
    sequence(sequence&&) noexcept = default;
    sequence& operator=(sequence&&) noexcept = default;

    // Return next sequence number and increment
    inline std::uint64_t next() noexcept {
        return next_seq_++;
    }

    // Peek at the next value without incrementing
    inline std::uint64_t current() const noexcept {
        return next_seq_;
    }

    inline void reset(std::uint64_t start = 1) noexcept {
        next_seq_ = start;
    }
};

} // namespace lcr
