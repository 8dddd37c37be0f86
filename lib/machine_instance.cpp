//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <algorithm>
#include <cmath>
#include <boost/random/uniform_real_distribution.hpp>
#include "padsim/machine_instance.h"
#include "padsim/config_error.h"

namespace padsim {

machine_instance::machine_instance(std::shared_ptr<const machine> definition)
    : definition_(definition)
    , blocking_spent_(boost::posix_time::seconds(0))
{
    if (!definition_) {
        throw config_error("machine instance without a definition");
    }
    definition_->validate();
}

boost::optional<action>
machine_instance::evaluate(trigger_event const& trigger, sim_time now, boost::random::mt19937& rng)
{
    if (!active_) {
        return boost::none;
    }

    state const& from = definition_->states[current_state_];
    auto it = from.transitions.find(trigger.kind);
    if (it == from.transitions.end()) {
        return boost::none;
    }

    // One draw per trigger, walked along the cumulative probabilities.
    double draw = boost::random::uniform_real_distribution<double>(0.0, 1.0)(rng);
    double cumulative = 0.0;
    boost::optional<std::size_t> target;
    for (transition const& t : it->second)
    {
        cumulative += t.probability;
        if (draw < cumulative) {
            target = t.target;
            break;
        }
    }
    if (!target) {
        return boost::none;
    }

    ++generation_;
    pending_ = boost::none;

    if (*target == machine::stop_state)
    {
        stop();
        action a;
        a.type = action::kind::stop;
        a.at = now;
        a.generation = generation_;
        return a;
    }

    current_state_ = *target;
    if (!limit_state_ or *limit_state_ != current_state_)
    {
        limit_state_ = current_state_;
        dist const& limit = definition_->states[current_state_].limit;
        if (limit.is_set()) {
            actions_left_ = static_cast<uint64_t>(std::llround(std::min(limit.sample(rng), 9.0e18)));
        } else {
            actions_left_ = boost::none;
        }
    }

    return arm(now, rng);
}

boost::optional<action> machine_instance::arm(sim_time now, boost::random::mt19937& rng)
{
    state const& st = definition_->states[current_state_];
    if (st.action == action_kind::none) {
        return boost::none;
    }
    if (actions_left_ and *actions_left_ == 0) {
        return boost::none;
    }

    action a;
    a.at = now + microseconds_to_duration(st.timeout.sample(rng));
    a.generation = generation_;
    a.bypass = st.bypass;
    a.replace = st.replace;

    if (st.action == action_kind::pad)
    {
        a.type = action::kind::pad;
        if (st.action_dist.is_set()) {
            double size = std::min(st.action_dist.sample(rng), 4294967295.0);
            a.bytes = static_cast<uint32_t>(std::llround(size));
        } else {
            a.bytes = machine::default_padding_size;
        }
        if (definition_->padding_budget and padding_spent_ + a.bytes > *definition_->padding_budget) {
            return boost::none;
        }
    }
    else
    {
        a.type = action::kind::block;
        a.duration = microseconds_to_duration(st.action_dist.sample(rng));
        if (definition_->blocking_budget and blocking_spent_ + a.duration > *definition_->blocking_budget) {
            return boost::none;
        }
    }

    pending_ = a;
    return a;
}

bool machine_instance::is_current(uint64_t generation) const
{
    return active_ and pending_ and pending_->generation == generation;
}

void machine_instance::fired(trigger_event const& event)
{
    pending_ = boost::none;
    if (actions_left_ and *actions_left_ > 0) {
        --*actions_left_;
    }
    if (event.kind == event_kind::padding_sent) {
        padding_spent_ += event.bytes;
    }
}

void machine_instance::stop()
{
    active_ = false;
    pending_ = boost::none;
    blocking_until_ = boost::none;
}

bool machine_instance::begin_blocking(sim_time now, sim_duration duration, bool bypass, bool replace)
{
    if (duration <= boost::posix_time::seconds(0)) {
        return false;
    }
    blocking_spent_ += duration;

    sim_time end = now + duration;
    if (replace or !is_blocking(now) or end > *blocking_until_)
    {
        blocking_until_ = end;
        blocking_bypassable_ = bypass;
    }
    return true;
}

bool machine_instance::end_blocking(sim_time now)
{
    if (!blocking_until_ or *blocking_until_ > now) {
        return false;
    }
    blocking_until_ = boost::none;
    return true;
}

bool machine_instance::is_blocking(sim_time now) const
{
    return active_ and blocking_until_ and now < *blocking_until_;
}

} // padsim namespace
