//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <iosfwd>
#include <limits>
#include "padsim/trigger_event.h"

namespace padsim {
namespace simulation {

enum class endpoint : uint8_t
{
    client,
    server,
};

inline endpoint opposite(endpoint side) {
    return side == endpoint::client ? endpoint::server : endpoint::client;
}

char const* endpoint_name(endpoint side);

/**
 * Where a scheduled event comes from. The numeric order is the tie-break
 * order for events scheduled at the same instant.
 */
enum class event_origin : uint8_t
{
    base_trace = 0,
    network = 1,
    machine = 2,
};

char const* origin_name(event_origin origin);

/**
 * An event waiting in the scheduler for its time to come.
 */
struct scheduled_event
{
    static const std::size_t no_trace_index = std::numeric_limits<std::size_t>::max();

    sim_time time;
    endpoint side{endpoint::client};
    trigger_event event;
    event_origin origin{event_origin::base_trace};
    /// Input record this base-trace event was derived from.
    std::size_t trace_index{no_trace_index};
    /// Instance generation that issued a machine action.
    uint64_t generation{0};
    /// Insertion order, assigned by the scheduler.
    uint64_t sequence{0};
    /// Flags of the machine state that scheduled the action, see padsim::state.
    bool bypass{false};
    bool replace{false};

    bool is_client() const { return side == endpoint::client; }
};

std::ostream& operator<<(std::ostream& os, scheduled_event const& ev);

} // simulation namespace
} // padsim namespace
