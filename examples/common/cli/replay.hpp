#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <ostream>
#include <iostream>
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"

namespace wireio::examples::cli::replay {

struct Params {
    std::string file;
    std::string ns                  = "/";
    std::vector<std::string> events = {"chat message"};
    std::string log_level           = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  File      : " << file << "\n"
           << "  Namespace : " << ns << "\n"
           << "  Events    : ";
        for (const auto& e : events) {
            os << "'" << e << "' ";
        }
        os << "\n  Log Level : " << log_level << "\n";
    }
};

inline auto namespace_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (!value.empty() && value.front() == '/') {
            return {};
        }
        return "Namespace must start with '/' (e.g. /chat)";
    },
    "Namespace validator"
);

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-f,--file", params.file, "Capture file, one raw frame per line")->required()->check(CLI::ExistingFile);
    app.add_option("-n,--namespace", params.ns, "Namespace forwarded to the engine")->check(namespace_validator)->default_val(params.ns);
    app.add_option("-e,--event", params.events, "Event name(s) to listen for")->default_val(params.events);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);

    app.footer(
        "Frames are dispatched exactly as a live server would deliver them.\n"
        "The replay stops at end of file or on the first bad frame."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace wireio::examples::cli::replay
