#pragma once

#include <string>
#include <string_view>
#include <cstddef>
#include <utility>

#include "wireio/core/protocol/message.hpp"
#include "wireio/core/protocol/detail/string_map.hpp"
#include "lcr/log/logger.hpp"


namespace wireio::core::protocol::event {

// -----------------------------------------------------------------------------
// Listeners
//
// event name -> single handler. Registering again replaces the previous
// handler (last registration wins). Events nobody listens to are dropped
// silently: no buffering, no default handler.
// -----------------------------------------------------------------------------
class Listeners {
public:
    Listeners() = default;

    Listeners(const Listeners&) = delete;
    Listeners& operator=(const Listeners&) = delete;

    inline void on(std::string event, EventCallback cb) {
        auto it = listeners_.find(event);
        if (it != listeners_.end()) {
            WIO_TRACE("[LISTENER] Replacing handler for event {" << event << "}");
            it->second = std::move(cb);
            return;
        }
        listeners_.emplace(std::move(event), std::move(cb));
    }

    // Returns true if a handler ran
    inline bool trigger(std::string_view event, const EventArgs& args) const {
        auto it = listeners_.find(event);
        if (it == listeners_.end() || !it->second) {
            WIO_TRACE("[LISTENER] No handler for event {" << event << "} -> drop.");
            return false;
        }
        // Copy: the handler may re-register itself while running
        EventCallback cb = it->second;
        cb(args);
        return true;
    }

    [[nodiscard]]
    inline bool contains(std::string_view event) const noexcept {
        return listeners_.find(event) != listeners_.end();
    }

    [[nodiscard]]
    inline std::size_t count() const noexcept {
        return listeners_.size();
    }

private:
    detail::string_map<EventCallback> listeners_;
};

} // namespace wireio::core::protocol::event
