//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <algorithm>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "padsim/simulation/trace_recorder.h"

namespace padsim {
namespace simulation {

std::string recorded_packet::to_string() const
{
    return boost::posix_time::to_simple_string(time)
        + (is_client ? " client " : " server ")
        + event.to_string();
}

bool operator==(recorded_packet const& a, recorded_packet const& b)
{
    return a.time == b.time and a.is_client == b.is_client and a.event == b.event;
}

trace_recorder::trace_recorder(std::size_t limit, bool network_only, bool client_only)
    : limit_(limit)
    , network_only_(network_only)
    , client_only_(client_only)
{
    packets_.reserve(limit_);
}

bool trace_recorder::record(scheduled_event const& ev, bool on_wire)
{
    if (full()) {
        return false;
    }
    if (network_only_ and (!on_wire or !ev.event.is_packet())) {
        return false;
    }
    if (client_only_ and !ev.is_client()) {
        return false;
    }

    recorded_packet p;
    p.time = ev.time;
    p.is_client = ev.is_client();
    p.event = ev.event;
    packets_.push_back(p);
    return true;
}

std::vector<recorded_packet> trace_recorder::take()
{
    std::vector<recorded_packet> result;
    result.swap(packets_);
    // Dispatch order is already time order, stable_sort keeps same-instant order.
    std::stable_sort(result.begin(), result.end(),
        [](recorded_packet const& a, recorded_packet const& b) { return a.time < b.time; });
    return result;
}

} // simulation namespace
} // padsim namespace
