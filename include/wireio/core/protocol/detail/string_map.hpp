#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <functional>
#include <cstddef>


namespace wireio::core::protocol::detail {

// Transparent hash: lets string-keyed maps be probed with string_view views
// into the parser buffer without allocating a temporary std::string.
struct string_hash {
    using is_transparent = void;

    inline std::size_t operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};

template<class V>
using string_map = std::unordered_map<std::string, V, string_hash, std::equal_to<>>;

} // namespace wireio::core::protocol::detail
