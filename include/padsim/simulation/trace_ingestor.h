//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <vector>
#include "padsim/trace_record.h"
#include "padsim/simulation/scheduled_event.h"

namespace padsim {
namespace simulation {

/**
 * Base trace split into the events each endpoint observes.
 * Both sequences are sorted by time; equal times keep record order.
 */
struct ingested_trace
{
    std::vector<scheduled_event> client;
    std::vector<scheduled_event> server;

    /**
     * Both sequences merged in seeding order: by time, then by record, with the
     * send of a record ahead of its receive.
     */
    std::vector<scheduled_event> merged() const;
};

/**
 * Convert client-side capture records into per-endpoint base-trace events.
 *
 * A packet sent by the client at t reaches the server at t + delay; a packet the
 * client received at t left the server at t - delay. Times are relative to origin.
 *
 * Throws config_error for an empty trace, negative or decreasing timestamps,
 * or negative sizes.
 */
ingested_trace ingest_trace(std::vector<trace_record> const& records,
                            sim_duration delay, sim_time origin);

} // simulation namespace
} // padsim namespace
