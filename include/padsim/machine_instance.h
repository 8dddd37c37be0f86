//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <memory>
#include <boost/optional/optional.hpp>
#include <boost/random/mersenne_twister.hpp>
#include "padsim/machine.h"

namespace padsim {

/**
 * Action scheduled by a machine instance in response to a trigger.
 */
struct action
{
    enum class kind : uint8_t
    {
        none,
        pad,
        block,
        stop,
    };

    kind type{kind::none};
    sim_time at;            ///< When the action fires.
    uint32_t bytes{0};      ///< Padding size, for pad.
    sim_duration duration;  ///< Block length, for block.
    uint64_t generation{0}; ///< Instance generation that armed the action.
    bool bypass{false};
    bool replace{false};
};

/**
 * Runtime state of one machine at one endpoint.
 *
 * Every transition bumps the generation; an armed action is only valid while the
 * generation it was issued with is still current, which is how a state change
 * cancels a pending timer.
 */
class machine_instance
{
    std::shared_ptr<const machine> definition_;
    std::size_t current_state_{0};
    uint64_t generation_{0};
    bool active_{true};

    /// Armed action waiting for its timeout.
    boost::optional<action> pending_;
    /// Actions left in the current state, when the state has a limit.
    boost::optional<uint64_t> actions_left_;
    /// State the current limit was sampled for.
    boost::optional<std::size_t> limit_state_;

    /// End of the block window opened by this instance.
    boost::optional<sim_time> blocking_until_;
    bool blocking_bypassable_{false};

    uint64_t padding_spent_{0};
    sim_duration blocking_spent_;

    boost::optional<action> arm(sim_time now, boost::random::mt19937& rng);

public:
    /// Validates the definition, throws config_error if it is malformed.
    explicit machine_instance(std::shared_ptr<const machine> definition);

    /**
     * Feed a trigger. Returns the action armed by the resulting transition, if any.
     * A transition to machine::stop_state deactivates the instance and returns a stop action.
     */
    boost::optional<action> evaluate(trigger_event const& trigger, sim_time now,
                                     boost::random::mt19937& rng);

    /// True if the action issued with this generation is still armed.
    bool is_current(uint64_t generation) const;

    /// Bookkeeping once the armed action has been carried out.
    void fired(trigger_event const& event);

    /// Deactivate; pending actions and the block window are dropped.
    void stop();

    /**
     * Open a block window of the given length. It takes over the current window
     * of this instance when it ends later or when replace is set, otherwise the
     * current window stays. The duration counts against the blocking budget
     * either way. Returns false for an empty window.
     */
    bool begin_blocking(sim_time now, sim_duration duration, bool bypass = false, bool replace = false);
    /// Close the window if it ends at or before now. False if the window was replaced.
    bool end_blocking(sim_time now);
    /// Drop the window without a BlockingEnd, another instance replaced it.
    void cancel_blocking() { blocking_until_ = boost::none; }
    /// True if this instance's block window covers now.
    bool is_blocking(sim_time now) const;
    /// True if the current window lets bypass padding through.
    bool is_bypassable() const { return blocking_bypassable_; }

    bool active() const { return active_; }
    std::size_t current_state() const { return current_state_; }
    uint64_t generation() const { return generation_; }
    boost::optional<action> const& pending() const { return pending_; }
    boost::optional<sim_time> const& blocking_until() const { return blocking_until_; }
    uint64_t padding_spent() const { return padding_spent_; }
    sim_duration blocking_spent() const { return blocking_spent_; }
    machine const& definition() const { return *definition_; }
};

} // padsim namespace
