#pragma once

#include <string>
#include <string_view>
#include <cstddef>
#include <utility>

#include "wireio/core/protocol/message.hpp"
#include "wireio/core/protocol/ack/id.hpp"
#include "wireio/core/protocol/detail/string_map.hpp"
#include "lcr/log/logger.hpp"


namespace wireio::core::protocol::ack {

/*
===============================================================================
Registry
===============================================================================

Purpose
-------
Tracks callbacks waiting for a server acknowledgement, keyed by a generated
correlation id:

  id -> AckCallback

Core Invariants
---------------
• Ids are unique while outstanding (fresh per add()).
• A callback runs at most once: the entry is erased before it is invoked.
• Resolving an unknown id (late, duplicate, foreign) is a no-op.
• No expiry: an unanswered entry stays until the registry is cleared or
  destroyed.
• Not thread-safe (event-loop only).

===============================================================================
*/

class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ------------------------------------------------------------
    // Register a callback, returns its correlation id
    // ------------------------------------------------------------
    [[nodiscard]]
    inline std::string add(AckCallback cb) {
        std::string id = ids_.next();
        WIO_TRACE("[ACK] Registered pending ack {" << id << "}");
        pending_.emplace(id, std::move(cb));
        return id;
    }

    // ------------------------------------------------------------
    // Resolve a pending ack
    // Returns true if a callback was found (and invoked)
    // ------------------------------------------------------------
    inline bool resolve(std::string_view id, const AckResponse& response) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            WIO_TRACE("[ACK] No pending ack for id {" << id << "} -> ignore.");
            return false;
        }

        AckCallback cb = std::move(it->second);
        pending_.erase(it);

        if (cb) {
            cb(response);
        }
        return true;
    }

    // ------------------------------------------------------------
    // Drop a pending ack without invoking it
    // ------------------------------------------------------------
    inline bool remove(std::string_view id) noexcept {
        auto it = pending_.find(id);
        if (it == pending_.end())
            return false;

        pending_.erase(it);
        return true;
    }

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    [[nodiscard]]
    inline bool contains(std::string_view id) const noexcept {
        return pending_.find(id) != pending_.end();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return pending_.empty();
    }

    [[nodiscard]]
    inline std::size_t count() const noexcept {
        return pending_.size();
    }

    inline void clear() noexcept {
        pending_.clear();
    }

private:
    detail::string_map<AckCallback> pending_;
    IdGenerator ids_;
};

} // namespace wireio::core::protocol::ack
