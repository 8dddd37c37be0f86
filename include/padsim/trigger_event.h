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
#include <string>
#include "padsim/types.h"

namespace padsim {

enum class event_kind : uint8_t
{
    non_padding_sent,
    non_padding_recv,
    padding_sent,
    padding_recv,
    blocking_begin,
    blocking_end,
    machine_start,
    machine_stop,
};

/// Short code of the event kind as used in trace dumps: sn, rn, sp, rp, bb, be, ms, mx.
char const* event_code(event_kind kind);

/**
 * An observable traffic event or an internal machine signal.
 *
 * Only the fields relevant to the kind are meaningful, the rest stay zero.
 * Use the named constructors below instead of filling the fields by hand.
 */
struct trigger_event
{
    event_kind kind{event_kind::non_padding_sent};
    uint32_t bytes{0};        ///< Packet size, for packet events.
    machine_id machine{0};    ///< Originating machine, for padding and control events.
    sim_duration duration;    ///< Block length, for blocking_begin.

    static trigger_event non_padding_sent(uint32_t bytes);
    static trigger_event non_padding_recv(uint32_t bytes);
    static trigger_event padding_sent(uint32_t bytes, machine_id machine);
    static trigger_event padding_recv(uint32_t bytes, machine_id machine);
    static trigger_event blocking_begin(machine_id machine, sim_duration duration);
    static trigger_event blocking_end(machine_id machine);
    static trigger_event machine_start(machine_id machine);
    static trigger_event machine_stop(machine_id machine);

    bool is_send() const {
        return kind == event_kind::non_padding_sent or kind == event_kind::padding_sent;
    }
    bool is_recv() const {
        return kind == event_kind::non_padding_recv or kind == event_kind::padding_recv;
    }
    /// True for events representing a packet on the wire.
    bool is_packet() const { return is_send() or is_recv(); }
    bool is_padding() const {
        return kind == event_kind::padding_sent or kind == event_kind::padding_recv;
    }

    /// "sn,100", "sp,1420", "bb", ...
    std::string to_string() const;
};

bool operator==(trigger_event const& a, trigger_event const& b);
inline bool operator!=(trigger_event const& a, trigger_event const& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& os, trigger_event const& ev);

} // padsim namespace
