//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <unordered_set>
#include <vector>
#include <boost/optional/optional.hpp>
#include <boost/signals2/signal.hpp>
#include "padsim/machine.h"
#include "padsim/trace_record.h"
#include "padsim/simulation/sim_config.h"
#include "padsim/simulation/event_scheduler.h"
#include "padsim/simulation/network.h"
#include "padsim/simulation/machine_host.h"
#include "padsim/simulation/trace_ingestor.h"
#include "padsim/simulation/trace_recorder.h"

namespace padsim {
namespace simulation {

/**
 * Simulator drives one run: it pops events off the scheduler in time order,
 * hands them to the endpoint hosts and records what happens on the wire.
 *
 * A simulator is single use. Load a trace, run it, take the trace.
 */
class simulator
{
    sim_config config_;
    network network_;
    machine_host client_;
    machine_host server_;
    event_scheduler scheduler_;
    trace_recorder recorder_;
    sim_time current_clock_;

    /// Base-trace records whose send was held; their pre-baked receive is dropped.
    std::unordered_set<std::size_t> rerouted_;
    /// Time of the event that filled the recorder.
    boost::optional<sim_time> limit_reached_at_;
    bool started_{false};
    bool halted_{false};
    std::size_t iterations_{0};

    machine_host& host_for(endpoint side);
    void start();
    void process(scheduled_event const& ev);
    void process_machine_event(machine_host& host, scheduled_event const& ev);
    /// Dispatch padding unless replace lets a packet sent around the same time stand in for it.
    void send_padding(machine_host& host, scheduled_event const& ev);
    void dispatch(machine_host& host, scheduled_event const& ev, bool on_wire = true);
    void push_all(std::vector<scheduled_event> const& events);

public:
    /**
     * Build the endpoint hosts. Throws config_error if the configuration or
     * one of the machine definitions is invalid.
     */
    simulator(sim_config const& config, machine_list const& client_machines,
              machine_list const& server_machines);

    /// Seed the scheduler with the base-trace events.
    void load(ingested_trace const& trace);

    /**
     * Run simulation to the end: limit reached, iteration cap hit or no events left.
     */
    void run();
    /**
     * Run just one simulation step.
     * @return false once the run is over.
     */
    bool run_step();

    bool halted() const { return halted_; }
    sim_time current_time() const { return current_clock_; }
    std::size_t iterations() const { return iterations_; }
    sim_config const& config() const { return config_; }
    machine_host const& client() const { return client_; }
    machine_host const& server() const { return server_; }
    trace_recorder const& recorder() const { return recorder_; }

    /// Move the recorded trace out.
    std::vector<recorded_packet> take_trace() { return recorder_.take(); }

    /// Fired for every dispatched event, recorded or not.
    using dispatch_signal = boost::signals2::signal<void (scheduled_event const&)>;
    dispatch_signal on_dispatch;
};

/**
 * Simulate a base trace with the given machines at client and server.
 * Either machine list may be empty. Throws config_error on invalid input.
 */
std::vector<recorded_packet> simulate(std::vector<trace_record> const& records,
                                      machine_list const& client_machines,
                                      machine_list const& server_machines,
                                      sim_config const& config);

} // simulation namespace
} // padsim namespace
