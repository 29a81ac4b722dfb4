#pragma once

/*
===============================================================================
wireio - Public API Entry Point
===============================================================================

Client-side message correlation for the `42[...]` event protocol.

  wireio::core::Session<Engine>   orchestrating façade (initialize / read /
                                  listen / emit / on / of / close)
  wireio::core::protocol::*       codec, router, ack + listener registries
  wireio::core::transport::*      engine contract and connection state

The engine (any type satisfying transport::EngineConcept) owns the actual
connection; wireio only decides what to emit and how to dispatch what arrives.
===============================================================================
*/

#include <wireio/core/error.hpp>
#include <wireio/core/config/protocol.hpp>
#include <wireio/core/transport/state.hpp>
#include <wireio/core/transport/engine_concept.hpp>
#include <wireio/core/protocol/arguments.hpp>
#include <wireio/core/protocol/message.hpp>
#include <wireio/core/protocol/codec.hpp>
#include <wireio/core/protocol/router.hpp>
#include <wireio/core/protocol/ack/registry.hpp>
#include <wireio/core/protocol/event/listeners.hpp>
#include <wireio/core/session.hpp>
