//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <ostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "padsim/simulation/scheduled_event.h"

namespace padsim {
namespace simulation {

const std::size_t scheduled_event::no_trace_index;

char const* endpoint_name(endpoint side)
{
    return side == endpoint::client ? "client" : "server";
}

char const* origin_name(event_origin origin)
{
    switch (origin)
    {
        case event_origin::base_trace: return "trace";
        case event_origin::network:    return "network";
        case event_origin::machine:    return "machine";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, scheduled_event const& ev)
{
    os << boost::posix_time::to_simple_string(ev.time)
       << " @" << endpoint_name(ev.side)
       << " " << ev.event
       << " [" << origin_name(ev.origin) << " #" << ev.sequence;
    if (ev.bypass) {
        os << " bypass";
    }
    if (ev.replace) {
        os << " replace";
    }
    return os << "]";
}

} // simulation namespace
} // padsim namespace
