//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <string>
#include <vector>
#include "padsim/simulation/scheduled_event.h"

namespace padsim {
namespace simulation {

/**
 * One entry of the simulated output trace.
 */
struct recorded_packet
{
    sim_time time;
    bool is_client{true};
    trigger_event event;

    /// "<time> client sn,100"
    std::string to_string() const;
};

bool operator==(recorded_packet const& a, recorded_packet const& b);
inline bool operator!=(recorded_packet const& a, recorded_packet const& b) { return !(a == b); }

/**
 * Trace recorder collects dispatched events into the output trace
 * until the event count limit is reached.
 */
class trace_recorder
{
    std::size_t limit_;
    bool network_only_;
    bool client_only_;
    std::vector<recorded_packet> packets_;

public:
    /**
     * @param limit        Maximum number of recorded events.
     * @param network_only Record packet events only (sn, rn, sp, rp).
     * @param client_only  Record client events only.
     */
    trace_recorder(std::size_t limit, bool network_only, bool client_only);

    /**
     * Append the event if it passes the filters and the limit is not reached yet.
     * @param on_wire False for padding that was replaced and never sent, which
     *                the network_only filter drops.
     * @return true if the event was recorded.
     */
    bool record(scheduled_event const& ev, bool on_wire = true);

    bool full() const { return packets_.size() >= limit_; }
    std::size_t size() const { return packets_.size(); }
    std::size_t limit() const { return limit_; }
    std::vector<recorded_packet> const& packets() const { return packets_; }

    /// Move the trace out, ordered by time. The recorder is left empty.
    std::vector<recorded_packet> take();
};

} // simulation namespace
} // padsim namespace
