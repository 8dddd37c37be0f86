//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <deque>
#include <vector>
#include <boost/optional/optional.hpp>
#include <boost/random/mersenne_twister.hpp>
#include "padsim/machine_instance.h"
#include "padsim/simulation/scheduled_event.h"

namespace padsim {
namespace simulation {

/**
 * Machine host runs the machine instances of one endpoint.
 *
 * It owns the instances, the random generator they draw from and the queue of
 * sends held back by blocking. Machine ids used by the host are
 * indices into the definition list it was built from.
 */
class machine_host
{
    endpoint side_;
    std::vector<machine_instance> instances_;
    /// Sends held while the endpoint is blocking, in arrival order.
    std::deque<scheduled_event> held_;
    boost::random::mt19937 rng_;
    /// Last packet that left this endpoint.
    boost::optional<sim_time> last_sent_time_;
    uint32_t last_sent_size_{0};

    machine_instance& instance_at(machine_id machine);
    scheduled_event make_event(machine_id machine, action const& a, sim_time now) const;

public:
    /**
     * Instantiate every definition. Throws config_error if one is malformed.
     * The generator is seeded from seed and the endpoint, so the two endpoints
     * of a run draw different sequences.
     */
    machine_host(endpoint side, machine_list const& definitions, uint64_t seed);

    endpoint side() const { return side_; }
    std::size_t size() const { return instances_.size(); }
    machine_instance const& instance(machine_id machine) const;

    /// MachineStart events for every instance, due at now.
    std::vector<scheduled_event> start(sim_time now) const;

    /**
     * Let every active instance react to an event observed at this endpoint.
     * MachineStart is only seen by the instance it names.
     * @return Newly armed actions as machine-origin events.
     */
    std::vector<scheduled_event> notify(trigger_event const& trigger, sim_time now);

    /// True if any active instance blocks at now. The window is [begin, end).
    bool is_blocking(sim_time now) const;
    /**
     * True if a send with the given bypass flag has to wait at now. Bypass
     * padding only waits for windows that are not bypassable.
     */
    bool blocks(sim_time now, bool bypass) const;

    void hold(scheduled_event ev);
    bool has_held() const { return !held_.empty(); }
    std::size_t held_count() const { return held_.size(); }

    /// Hand back all held events rescheduled at now as trace events, oldest first.
    std::vector<scheduled_event> release_blocked(sim_time now);

    /// How close a packet must be to padding for the padding to be replaced by it.
    static sim_duration replace_window();

    /// Note a packet leaving this endpoint.
    void sent(sim_time now, uint32_t bytes);
    /// True if a packet of at most bytes left within the replace window before now.
    bool sent_recently(sim_time now, uint32_t bytes) const;

    bool is_current(machine_id machine, uint64_t generation) const;
    /**
     * Open a block window for a machine. With replace, the new window is the
     * only one left at this endpoint, windows of other instances are dropped.
     */
    bool begin_blocking(machine_id machine, sim_time now, sim_duration duration,
                        bool bypass = false, bool replace = false);
    bool end_blocking(machine_id machine, sim_time now);
    void fired(machine_id machine, trigger_event const& event);
};

} // simulation namespace
} // padsim namespace
