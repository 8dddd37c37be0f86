//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <functional>
#include <vector>
#include <boost/optional/optional.hpp>
#include "padsim/simulation/scheduled_event.h"

namespace padsim {
namespace simulation {

/**
 * Global time-ordered queue of pending events.
 *
 * Events pop by time, then by origin (trace, network, machine), then in
 * the order they were pushed. Pushed events are never removed or reordered
 * otherwise, so a run can be replayed exactly.
 */
class event_scheduler
{
    struct later
    {
        bool operator()(scheduled_event const& a, scheduled_event const& b) const;
    };

    /// Binary heap kept with std::push_heap and std::pop_heap, earliest on top.
    std::vector<scheduled_event> queue_;
    uint64_t next_sequence_{0};

public:
    /// Queue an event. Its sequence number is overwritten.
    void push(scheduled_event ev);

    boost::optional<scheduled_event> pop_earliest();

    /// Earliest event without removing it, nullptr if empty.
    scheduled_event const* peek() const;

    /**
     * Walk the events due no later than until in pop order and return the first
     * one that matches, nullptr if none does. Nothing is removed.
     */
    scheduled_event const* find_first(sim_time until,
        std::function<bool (scheduled_event const&)> const& match) const;

    bool empty() const { return queue_.empty(); }
    std::size_t size() const { return queue_.size(); }
};

} // simulation namespace
} // padsim namespace
