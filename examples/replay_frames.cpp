// ============================================================================
// Replay example
//
// Demonstrates:
// - Driving a Session with a custom engine (capture file)
// - Registering event listeners
// - Emitting with an acknowledgement callback
// - Blocking listen() loop and its stop-on-first-error policy
// - Close on scope exit
// ============================================================================
#include <iostream>
#include <string>
#include <string_view>

#include <simdjson.h>

#include "wireio.hpp"

#include "common/cli/replay.hpp"
#include "common/file_engine.hpp"


int main(int argc, char** argv) {
    using namespace wireio::core;
    using namespace wireio::examples;

    const auto params = cli::replay::configure(argc, argv, "wireio frame replay");
    params.dump("Parameters", std::cout);

    Session<FileEngine> session{FileEngine{params.file}};

    if (session.initialize() != Error::None) {
        std::cerr << "[wireio] Failed to open " << params.file << "\n";
        return 1;
    }

    session.of(params.ns);

    int events_received = 0;
    for (const auto& name : params.events) {
        session.on(name, [&events_received, name](const protocol::EventArgs& args) {
            ++events_received;
            std::cout << " -> " << name << "(";
            for (std::size_t i = 0; i < args.size(); ++i) {
                std::cout << (i ? ", " : "") << simdjson::minify(args[i]);
            }
            std::cout << ")" << std::endl;
        });
    }

    // A capture that contains 42["ACK","<id>",...] for this id would resolve it;
    // ids are generated per run, so a static capture normally leaves it pending.
    protocol::Arguments hello;
    hello.push("replay");
    const bool sent = session.emit("hello", hello, [](const protocol::AckResponse& r) {
        std::cout << " <- hello acknowledged";
        if (r.has()) {
            std::cout << ": " << simdjson::minify(r.value());
        }
        std::cout << std::endl;
    });
    if (!sent) {
        std::cerr << "[wireio] hello was not sent\n";
    }

    const Error stop = session.listen();

    std::cout << "\n[SUMMARY] events=" << events_received
              << " pending_acks=" << session.pending_acks()
              << " stop=" << stop << std::endl;

    // Session closes the engine on scope exit
    return (stop == Error::RemoteClosed) ? 0 : 2;
}
