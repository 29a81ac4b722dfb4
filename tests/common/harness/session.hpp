/*
===============================================================================
 Session Test Harness
===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "wireio/core/session.hpp"
#include "common/mock_engine.hpp"
#include "common/frames.hpp"
#include "common/test_check.hpp"


namespace wireio::core::test::harness {

using EngineUnderTest  = transport::test::MockEngine;
using SessionUnderTest = core::Session<EngineUnderTest>;

struct Session {
    SessionUnderTest session;

    // -------------------------------------------------------------------------
    // Connect (asserts success)
    // -------------------------------------------------------------------------
    inline void connect() {
        TEST_CHECK(session.initialize() == Error::None);
        TEST_CHECK(session.is_connected());
    }

    inline EngineUnderTest& engine() {
        return session.engine();
    }

    // -------------------------------------------------------------------------
    // Deliver one scripted frame through read()
    // -------------------------------------------------------------------------
    inline Error deliver(std::string frame) {
        engine().push_frame(std::move(frame));
        return session.read();
    }

    // -------------------------------------------------------------------------
    // Emit with ack and return the id carried by the trailing marker
    // -------------------------------------------------------------------------
    template<class F>
    inline std::string emit_with_ack(std::string_view event, protocol::Arguments args, F&& cb) {
        TEST_CHECK(session.emit(event, std::move(args), std::forward<F>(cb)));
        const auto& last = engine().emitted().back();
        TEST_CHECK(last.expects_ack);
        TEST_CHECK(!last.args.empty());
        auto id = frames::ack_id_from_marker(last.args.back());
        TEST_CHECK(!id.empty());
        return id;
    }
};

} // namespace wireio::core::test::harness
