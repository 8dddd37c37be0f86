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
#include "padsim/trigger_event.h"

namespace padsim {

char const* event_code(event_kind kind)
{
    switch (kind)
    {
        case event_kind::non_padding_sent: return "sn";
        case event_kind::non_padding_recv: return "rn";
        case event_kind::padding_sent:     return "sp";
        case event_kind::padding_recv:     return "rp";
        case event_kind::blocking_begin:   return "bb";
        case event_kind::blocking_end:     return "be";
        case event_kind::machine_start:    return "ms";
        case event_kind::machine_stop:     return "mx";
    }
    return "??";
}

//=================================================================================================
// trigger_event
//=================================================================================================

trigger_event trigger_event::non_padding_sent(uint32_t bytes)
{
    trigger_event ev;
    ev.kind = event_kind::non_padding_sent;
    ev.bytes = bytes;
    return ev;
}

trigger_event trigger_event::non_padding_recv(uint32_t bytes)
{
    trigger_event ev;
    ev.kind = event_kind::non_padding_recv;
    ev.bytes = bytes;
    return ev;
}

trigger_event trigger_event::padding_sent(uint32_t bytes, machine_id machine)
{
    trigger_event ev;
    ev.kind = event_kind::padding_sent;
    ev.bytes = bytes;
    ev.machine = machine;
    return ev;
}

trigger_event trigger_event::padding_recv(uint32_t bytes, machine_id machine)
{
    trigger_event ev;
    ev.kind = event_kind::padding_recv;
    ev.bytes = bytes;
    ev.machine = machine;
    return ev;
}

trigger_event trigger_event::blocking_begin(machine_id machine, sim_duration duration)
{
    trigger_event ev;
    ev.kind = event_kind::blocking_begin;
    ev.machine = machine;
    ev.duration = duration;
    return ev;
}

trigger_event trigger_event::blocking_end(machine_id machine)
{
    trigger_event ev;
    ev.kind = event_kind::blocking_end;
    ev.machine = machine;
    return ev;
}

trigger_event trigger_event::machine_start(machine_id machine)
{
    trigger_event ev;
    ev.kind = event_kind::machine_start;
    ev.machine = machine;
    return ev;
}

trigger_event trigger_event::machine_stop(machine_id machine)
{
    trigger_event ev;
    ev.kind = event_kind::machine_stop;
    ev.machine = machine;
    return ev;
}

std::string trigger_event::to_string() const
{
    std::string result = event_code(kind);
    if (is_packet()) {
        result += "," + std::to_string(bytes);
    }
    return result;
}

bool operator==(trigger_event const& a, trigger_event const& b)
{
    return a.kind == b.kind
        and a.bytes == b.bytes
        and a.machine == b.machine
        and a.duration == b.duration;
}

std::ostream& operator<<(std::ostream& os, trigger_event const& ev)
{
    os << ev.to_string();
    if (ev.kind == event_kind::blocking_begin) {
        os << "(" << boost::posix_time::to_simple_string(ev.duration) << ")";
    }
    return os;
}

} // padsim namespace
