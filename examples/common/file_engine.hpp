#pragma once

#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include "wireio/core/error.hpp"
#include "wireio/core/protocol/arguments.hpp"
#include "wireio/core/transport/engine_concept.hpp"
#include "lcr/log/logger.hpp"


namespace wireio::examples {

// -----------------------------------------------------------------------------
// FileEngine
//
// Replays a capture file (one raw frame per line) as if it were arriving from
// a server. Outbound emits are rendered as `42[...]` frames into the log, with
// the namespace prefix the engine would put on the wire.
// -----------------------------------------------------------------------------
class FileEngine {
public:
    explicit FileEngine(std::string path)
        : path_(std::move(path))
    {
    }

    FileEngine(FileEngine&&) = default;

    inline core::Error connect() noexcept {
        in_.open(path_);
        if (!in_.is_open()) {
            WIO_ERROR("[FileEngine] Cannot open capture file: " << path_);
            return core::Error::ConnectionFailed;
        }
        WIO_INFO("[FileEngine] Replaying " << path_);
        return core::Error::None;
    }

    inline core::Error read(std::string& frame) noexcept {
        if (!in_.is_open()) {
            return core::Error::InvalidState;
        }
        if (!std::getline(in_, frame)) {
            return in_.eof() ? core::Error::RemoteClosed : core::Error::TransportFailure;
        }
        if (!frame.empty() && frame.back() == '\r') {
            frame.pop_back();
        }
        return core::Error::None;
    }

    inline bool emit(std::string_view event, const core::protocol::Arguments& args, bool expects_ack) noexcept {
        if (!in_.is_open()) {
            return false;
        }
        core::protocol::Arguments frame;
        frame.push(event);
        for (const auto& a : args) {
            frame.push_raw(a);
        }
        WIO_INFO("[FileEngine] >> 42" << (namespace_ == "/" ? "" : namespace_ + ",")
                 << frame << (expects_ack ? " (ack requested)" : ""));
        return true;
    }

    inline void of(std::string_view ns) noexcept {
        namespace_ = std::string(ns);
    }

    inline void close() noexcept {
        if (in_.is_open()) {
            in_.close();
            WIO_INFO("[FileEngine] Closed");
        }
    }

private:
    std::string path_;
    std::string namespace_ = "/";
    std::ifstream in_;
};

static_assert(core::transport::EngineConcept<FileEngine>);

} // namespace wireio::examples
