#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cmath>
#include <charconv>


namespace lcr {
namespace json {

// Append `s` to `out` with JSON string escaping (no surrounding quotes)
inline void escape_into(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                }
                else {
                    out += c;
                }
        }
    }
}

inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    escape_into(out, s);
    return out;
}

// Quoted JSON string literal
inline std::string quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    escape_into(out, s);
    out += '"';
    return out;
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value) {
    if (value < 0) {
        out += '-';
        // two's complement negation that is safe for INT64_MIN
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

// Shortest round-trippable double representation.
// JSON has no NaN or infinity: non-finite values are written as null.
inline void append(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc{}) {
        out.append(buf, static_cast<std::size_t>(ptr - buf));
    }
    else {
        out += "null";
    }
}

// Lowercase hex, zero-padded to at least `width` digits
inline void append_hex(std::string& out, std::uint64_t value, std::size_t width = 1) {
    static constexpr char hex[] = "0123456789abcdef";
    char buf[16];
    std::size_t n = 0;
    do {
        buf[n++] = hex[value & 0x0F];
        value >>= 4;
    } while (value > 0 && n < sizeof(buf));
    for (std::size_t i = n; i < width; ++i) {
        out += '0';
    }
    while (n > 0) {
        out += buf[--n];
    }
}

} // namespace json
} // namespace lcr
