//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <stdexcept>
#include "padsim/simulation/network.h"
#include "padsim/config_error.h"

namespace padsim {
namespace simulation {

network::network(sim_duration delay)
    : delay_(delay)
{
    if (delay_.is_special() or delay_.is_negative()) {
        throw config_error("network delay must be a non-negative duration");
    }
}

scheduled_event network::deliver(trigger_event const& sent, endpoint from, sim_time sent_at) const
{
    scheduled_event arrival;
    arrival.time = sent_at + delay_;
    arrival.side = opposite(from);
    arrival.origin = event_origin::network;

    switch (sent.kind)
    {
        case event_kind::non_padding_sent:
            arrival.event = trigger_event::non_padding_recv(sent.bytes);
            break;
        case event_kind::padding_sent:
            arrival.event = trigger_event::padding_recv(sent.bytes, sent.machine);
            break;
        default:
            throw std::invalid_argument(std::string("network can only deliver sent packets, not ")
                + event_code(sent.kind));
    }
    return arrival;
}

} // simulation namespace
} // padsim namespace
