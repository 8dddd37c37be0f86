//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <stdexcept>
#include <boost/assert.hpp>
#include <boost/log/trivial.hpp>
#include <boost/random/seed_seq.hpp>
#include "padsim/simulation/machine_host.h"

namespace padsim {
namespace simulation {

namespace {

/// Mix all 64 bits of the run seed and the endpoint into the generator state.
boost::random::mt19937 seeded_generator(uint64_t seed, endpoint side)
{
    boost::random::seed_seq seq{static_cast<uint32_t>(seed),
                                static_cast<uint32_t>(seed >> 32),
                                static_cast<uint32_t>(side == endpoint::server ? 1 : 0)};
    return boost::random::mt19937(seq);
}

} // anonymous namespace

machine_host::machine_host(endpoint side, machine_list const& definitions, uint64_t seed)
    : side_(side)
    , rng_(seeded_generator(seed, side))
{
    instances_.reserve(definitions.size());
    for (auto const& def : definitions) {
        instances_.emplace_back(def);
    }
    BOOST_LOG_TRIVIAL(debug) << "Host " << endpoint_name(side_) << " runs "
                             << instances_.size() << " machines";
}

//=================================================================================================
// Instances
//=================================================================================================

machine_instance& machine_host::instance_at(machine_id machine)
{
    BOOST_ASSERT_MSG(machine < instances_.size(), "event refers to a machine this host does not run");
    return instances_.at(machine);
}

machine_instance const& machine_host::instance(machine_id machine) const
{
    BOOST_ASSERT_MSG(machine < instances_.size(), "event refers to a machine this host does not run");
    return instances_.at(machine);
}

scheduled_event machine_host::make_event(machine_id machine, action const& a, sim_time now) const
{
    scheduled_event ev;
    ev.side = side_;
    ev.origin = event_origin::machine;
    ev.generation = a.generation;
    ev.time = a.at;
    ev.bypass = a.bypass;
    ev.replace = a.replace;

    switch (a.type)
    {
        case action::kind::pad:
            ev.event = trigger_event::padding_sent(a.bytes, machine);
            break;
        case action::kind::block:
            ev.event = trigger_event::blocking_begin(machine, a.duration);
            break;
        case action::kind::stop:
            ev.event = trigger_event::machine_stop(machine);
            ev.time = now;
            break;
        case action::kind::none:
            throw std::logic_error("machine instance returned an empty action");
    }
    return ev;
}

std::vector<scheduled_event> machine_host::start(sim_time now) const
{
    std::vector<scheduled_event> events;
    for (machine_id i = 0; i < instances_.size(); ++i)
    {
        scheduled_event ev;
        ev.time = now;
        ev.side = side_;
        ev.origin = event_origin::machine;
        ev.event = trigger_event::machine_start(i);
        ev.generation = instances_[i].generation();
        events.push_back(ev);
    }
    return events;
}

std::vector<scheduled_event> machine_host::notify(trigger_event const& trigger, sim_time now)
{
    std::vector<scheduled_event> scheduled;
    for (machine_id i = 0; i < instances_.size(); ++i)
    {
        if (trigger.kind == event_kind::machine_start and trigger.machine != i) {
            continue;
        }
        machine_instance& inst = instances_[i];
        if (!inst.active()) {
            continue;
        }
        auto a = inst.evaluate(trigger, now, rng_);
        if (a) {
            scheduled.push_back(make_event(i, *a, now));
        }
    }
    return scheduled;
}

//=================================================================================================
// Blocking
//=================================================================================================

bool machine_host::is_blocking(sim_time now) const
{
    for (auto const& inst : instances_) {
        if (inst.is_blocking(now)) {
            return true;
        }
    }
    return false;
}

bool machine_host::blocks(sim_time now, bool bypass) const
{
    for (auto const& inst : instances_) {
        if (inst.is_blocking(now) and (!bypass or !inst.is_bypassable())) {
            return true;
        }
    }
    return false;
}

void machine_host::hold(scheduled_event ev)
{
    held_.push_back(ev);
}

std::vector<scheduled_event> machine_host::release_blocked(sim_time now)
{
    std::vector<scheduled_event> released;
    released.reserve(held_.size());
    while (!held_.empty())
    {
        scheduled_event ev = held_.front();
        held_.pop_front();
        ev.time = now;
        // Back in as trace events, ahead of machine events at the same instant.
        ev.origin = event_origin::base_trace;
        released.push_back(ev);
    }
    return released;
}

bool machine_host::is_current(machine_id machine, uint64_t generation) const
{
    return instance(machine).is_current(generation);
}

sim_duration machine_host::replace_window()
{
    return boost::posix_time::microseconds(1);
}

void machine_host::sent(sim_time now, uint32_t bytes)
{
    last_sent_time_ = now;
    last_sent_size_ = bytes;
}

bool machine_host::sent_recently(sim_time now, uint32_t bytes) const
{
    return last_sent_time_ and now - *last_sent_time_ <= replace_window()
        and last_sent_size_ <= bytes;
}

bool machine_host::begin_blocking(machine_id machine, sim_time now, sim_duration duration,
                                  bool bypass, bool replace)
{
    if (!instance_at(machine).begin_blocking(now, duration, bypass, replace)) {
        return false;
    }
    if (replace)
    {
        for (machine_id i = 0; i < instances_.size(); ++i) {
            if (i != machine) {
                instances_[i].cancel_blocking();
            }
        }
    }
    return true;
}

bool machine_host::end_blocking(machine_id machine, sim_time now)
{
    return instance_at(machine).end_blocking(now);
}

void machine_host::fired(machine_id machine, trigger_event const& event)
{
    instance_at(machine).fired(event);
}

} // simulation namespace
} // padsim namespace
