//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <map>
#include <memory>
#include <vector>
#include <boost/optional/optional.hpp>
#include "padsim/dist.h"
#include "padsim/trigger_event.h"

namespace padsim {

/// What a state does once its timeout expires.
enum class action_kind : uint8_t
{
    none,
    pad,
    block,
};

struct transition
{
    std::size_t target;  ///< State index or machine::stop_state.
    double probability;
};

/**
 * One state of a machine.
 *
 * Entering the state (from any state, including itself) samples the timeout and
 * the action parameter and arms the action. Leaving it before the timeout expires
 * cancels the action.
 */
struct state
{
    action_kind action{action_kind::none};
    /// Microseconds from entering the state to the action.
    dist timeout;
    /// Padding size in bytes, or block duration in microseconds.
    dist action_dist;
    /// Max number of actions performed while the machine keeps to this state. Unset means no limit.
    dist limit;
    /// Possible next states for each event kind. Probabilities of one event add up to at most 1.
    std::map<event_kind, std::vector<transition>> transitions;
    /**
     * Padding goes out through a bypassable block, a block lets bypass padding through.
     */
    bool bypass{false};
    /**
     * Padding may be skipped when a packet of at most its size leaves the endpoint
     * within the replace window. A block overrides the current window even if it
     * ends earlier.
     */
    bool replace{false};

    state() = default;
    explicit state(action_kind a) : action(a) {}

    /// Add a transition, returns *this for chaining.
    state& on(event_kind ev, std::size_t target, double probability = 1.0);
};

/**
 * Immutable traffic-shaping policy: a finite state graph with timed and
 * probabilistic transitions. State 0 is the start state.
 *
 * The same definition can be shared by any number of concurrent simulations,
 * all runtime state lives in machine_instance.
 */
class machine
{
public:
    /// Transition target that stops the machine.
    static const std::size_t stop_state;
    /// Padding size used when a pad state has no action distribution.
    static const uint32_t default_padding_size;

    std::vector<state> states;
    /// Max padding bytes over the whole run. Unset means unlimited.
    boost::optional<uint64_t> padding_budget;
    /// Max total blocking time over the whole run. Unset means unlimited.
    boost::optional<sim_duration> blocking_budget;

    machine() = default;
    explicit machine(std::vector<state> s) : states(std::move(s)) {}

    /**
     * Check the state graph. Throws config_error when a transition points to an
     * undefined state, probabilities are out of range, or a distribution is invalid.
     * Unreachable states are accepted with a warning.
     */
    void validate() const;
};

using machine_list = std::vector<std::shared_ptr<const machine>>;

} // padsim namespace
