//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <algorithm>
#include "padsim/simulation/event_scheduler.h"

namespace padsim {
namespace simulation {

// The heap keeps the greatest element on top, so "later" ranks above.
bool event_scheduler::later::operator()(scheduled_event const& a, scheduled_event const& b) const
{
    if (a.time != b.time) {
        return a.time > b.time;
    }
    if (a.origin != b.origin) {
        return a.origin > b.origin;
    }
    return a.sequence > b.sequence;
}

void event_scheduler::push(scheduled_event ev)
{
    ev.sequence = next_sequence_++;
    queue_.push_back(std::move(ev));
    std::push_heap(queue_.begin(), queue_.end(), later());
}

boost::optional<scheduled_event> event_scheduler::pop_earliest()
{
    if (queue_.empty()) {
        return boost::none;
    }
    std::pop_heap(queue_.begin(), queue_.end(), later());
    scheduled_event next = std::move(queue_.back());
    queue_.pop_back();
    return next;
}

scheduled_event const* event_scheduler::peek() const
{
    return queue_.empty() ? nullptr : &queue_.front();
}

scheduled_event const* event_scheduler::find_first(sim_time until,
    std::function<bool (scheduled_event const&)> const& match) const
{
    std::vector<scheduled_event const*> due;
    for (auto const& ev : queue_) {
        if (ev.time <= until) {
            due.push_back(&ev);
        }
    }
    std::sort(due.begin(), due.end(),
        [](scheduled_event const* a, scheduled_event const* b) { return later()(*b, *a); });
    for (auto ev : due) {
        if (match(*ev)) {
            return ev;
        }
    }
    return nullptr;
}

} // simulation namespace
} // padsim namespace
