#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <initializer_list>
#include <utility>
#include <concepts>
#include <type_traits>

#include "lcr/json.hpp"


namespace wireio::core::protocol {

/*
===============================================================================
Arguments
===============================================================================

Ordered list of outbound event arguments, each stored as an already-encoded
JSON value. The Session appends to it (ack marker) and hands it to the engine,
which owns the actual frame layout.

  Arguments args;
  args.push("hi").push(42).push(true);
  args.to_json();   // ["hi",42,true]

Encoding happens at push time so the engine never needs a JSON library.
===============================================================================
*/

class Arguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

    Arguments() = default;

    // Convenience: list of string arguments
    Arguments(std::initializer_list<std::string_view> strings) {
        values_.reserve(strings.size());
        for (auto s : strings) {
            push(s);
        }
    }

    // -------------------------------------------------------------------------
    // Builders
    // -------------------------------------------------------------------------
    inline Arguments& push(std::string_view s) {
        values_.push_back(lcr::json::quote(s));
        return *this;
    }

    inline Arguments& push(const char* s) {
        return push(std::string_view{s});
    }

    inline Arguments& push(const std::string& s) {
        return push(std::string_view{s});
    }

    // Any integer type except bool, signed or unsigned
    template<std::integral T>
        requires (!std::same_as<T, bool>)
    inline Arguments& push(T v) {
        std::string out;
        if constexpr (std::is_signed_v<T>) {
            lcr::json::append(out, static_cast<std::int64_t>(v));
        }
        else {
            lcr::json::append(out, static_cast<std::uint64_t>(v));
        }
        values_.push_back(std::move(out));
        return *this;
    }

    // NaN and infinities are encoded as null
    inline Arguments& push(double v) {
        std::string out;
        lcr::json::append(out, v);
        values_.push_back(std::move(out));
        return *this;
    }

    inline Arguments& push(bool v) {
        values_.emplace_back(v ? "true" : "false");
        return *this;
    }

    inline Arguments& push_null() {
        values_.emplace_back("null");
        return *this;
    }

    // Caller guarantees `json` is a single valid JSON value
    inline Arguments& push_raw(std::string json) {
        values_.push_back(std::move(json));
        return *this;
    }

    // -------------------------------------------------------------------------
    // Access
    // -------------------------------------------------------------------------
    [[nodiscard]] inline std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]]
    inline const std::string& operator[](std::size_t i) const noexcept { return values_[i]; }

    [[nodiscard]]
    inline const std::string& back() const noexcept { return values_.back(); }

    inline const_iterator begin() const noexcept { return values_.begin(); }
    inline const_iterator end() const noexcept { return values_.end(); }

    // Renders the arguments as a JSON array: [a0,a1,...]
    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        std::size_t size = 2;
        for (const auto& v : values_) {
            size += v.size() + 1;
        }
        out.reserve(size);
        out += '[';
        for (std::size_t i = 0; i < values_.size(); ++i) {
            if (i > 0) out += ',';
            out += values_[i];
        }
        out += ']';
        return out;
    }

    friend bool operator==(const Arguments& a, const Arguments& b) noexcept {
        return a.values_ == b.values_;
    }

private:
    std::vector<std::string> values_;
};

inline std::ostream& operator<<(std::ostream& os, const Arguments& args) {
    return os << args.to_json();
}

} // namespace wireio::core::protocol
