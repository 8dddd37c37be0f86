//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "padsim/simulation/scheduled_event.h"

namespace padsim {
namespace simulation {

/**
 * Link between client and server.
 *
 * Only a fixed one-way propagation delay is modelled: no bandwidth, queueing,
 * loss, jitter or reordering.
 */
class network
{
    sim_duration delay_;

public:
    explicit network(sim_duration delay);

    sim_duration delay() const { return delay_; }

    /**
     * Turn a packet sent at one endpoint into its arrival at the other one.
     * @param sent    A non_padding_sent or padding_sent event.
     * @param from    Endpoint the packet leaves.
     * @param sent_at Time it leaves.
     * @return The matching receive event, delay later, with network origin.
     */
    scheduled_event deliver(trigger_event const& sent, endpoint from, sim_time sent_at) const;
};

} // simulation namespace
} // padsim namespace
