/*
================================================================================
event::Listeners - Unit Tests
================================================================================

Covered:
  • handler receives args in positional order
  • last registration wins (no stacking)
  • unregistered events are dropped silently
  • a handler may replace itself while running
================================================================================
*/

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "wireio/core/protocol/event/listeners.hpp"
#include "common/test_check.hpp"

using namespace wireio::core::protocol;


static EventArgs parse_args(simdjson::dom::parser& parser, const std::string& json) {
    simdjson::dom::array items;
    TEST_CHECK(!parser.parse(json).get(items));
    EventArgs args;
    for (simdjson::dom::element e : items) {
        args.push_back(e);
    }
    return args;
}

void test_trigger_positional_args() {
    std::cout << "[TEST] Handler receives positional args..." << std::endl;

    simdjson::dom::parser parser;
    auto args = parse_args(parser, R"(["a","b","c"])");

    event::Listeners listeners;
    std::vector<std::string> seen;
    listeners.on("letters", [&](const EventArgs& in) {
        for (const auto& e : in) {
            std::string_view s;
            TEST_CHECK(!e.get(s));
            seen.emplace_back(s);
        }
    });

    TEST_CHECK(listeners.trigger("letters", args));
    TEST_CHECK(seen.size() == 3);
    TEST_CHECK(seen[0] == "a");
    TEST_CHECK(seen[1] == "b");
    TEST_CHECK(seen[2] == "c");

    std::cout << "[TEST] OK\n";
}

void test_last_registration_wins() {
    std::cout << "[TEST] Last registration wins..." << std::endl;

    event::Listeners listeners;
    int h1 = 0;
    int h2 = 0;
    listeners.on("foo", [&](const EventArgs&) { ++h1; });
    listeners.on("foo", [&](const EventArgs&) { ++h2; });

    TEST_CHECK(listeners.count() == 1);
    TEST_CHECK(listeners.trigger("foo", EventArgs{}));
    TEST_CHECK(h1 == 0);
    TEST_CHECK(h2 == 1);

    std::cout << "[TEST] OK\n";
}

void test_unregistered_event_dropped() {
    std::cout << "[TEST] Unregistered event is dropped..." << std::endl;

    event::Listeners listeners;
    int calls = 0;
    listeners.on("foo", [&](const EventArgs&) { ++calls; });

    TEST_CHECK(!listeners.trigger("bar", EventArgs{}));
    TEST_CHECK(!listeners.trigger("Foo", EventArgs{}));
    TEST_CHECK(calls == 0);
    TEST_CHECK(!listeners.contains("bar"));
    TEST_CHECK(listeners.contains("foo"));

    std::cout << "[TEST] OK\n";
}

void test_empty_handler_not_invoked() {
    std::cout << "[TEST] Empty handler is not invoked..." << std::endl;

    event::Listeners listeners;
    listeners.on("foo", EventCallback{});
    TEST_CHECK(listeners.contains("foo"));
    TEST_CHECK(!listeners.trigger("foo", EventArgs{}));

    std::cout << "[TEST] OK\n";
}

void test_handler_replaces_itself() {
    std::cout << "[TEST] Handler replaces itself while running..." << std::endl;

    event::Listeners listeners;
    int first = 0;
    int second = 0;
    listeners.on("once", [&](const EventArgs&) {
        ++first;
        listeners.on("once", [&](const EventArgs&) { ++second; });
    });

    TEST_CHECK(listeners.trigger("once", EventArgs{}));
    TEST_CHECK(listeners.trigger("once", EventArgs{}));
    TEST_CHECK(first == 1);
    TEST_CHECK(second == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_trigger_positional_args();
    test_last_registration_wins();
    test_unregistered_event_dropped();
    test_empty_handler_not_invoked();
    test_handler_replaces_itself();

    std::cout << "\n[LISTENER TESTS PASSED]\n";
    return 0;
}
