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
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>
#include "padsim/simulation/simulator.h"

namespace padsim {
namespace simulation {

namespace {

sim_config const& validated(sim_config const& config)
{
    config.validate();
    return config;
}

/**
 * A send waits while a block it cannot bypass covers it, and while earlier
 * sends of its endpoint are still held. A send that passes a block also
 * passes the held ones.
 */
bool must_wait(machine_host const& host, scheduled_event const& ev)
{
    if (host.blocks(ev.time, ev.bypass)) {
        return true;
    }
    if (host.is_blocking(ev.time)) {
        return false;
    }
    return host.has_held();
}

} // anonymous namespace

simulator::simulator(sim_config const& config, machine_list const& client_machines,
                     machine_list const& server_machines)
    : config_(validated(config))
    , network_(config_.delay)
    , client_(endpoint::client, client_machines, config_.seed)
    , server_(endpoint::server, server_machines, config_.seed)
    , recorder_(config_.limit, config_.network_only, config_.client_only)
    , current_clock_(simulation_epoch())
{
}

void simulator::load(ingested_trace const& trace)
{
    if (started_) {
        throw std::logic_error("trace loaded into a running simulation");
    }
    for (auto const& ev : trace.merged()) {
        scheduler_.push(ev);
    }
    BOOST_LOG_TRIVIAL(debug) << "Loaded " << scheduler_.size() << " base trace events";
}

machine_host& simulator::host_for(endpoint side)
{
    return side == endpoint::client ? client_ : server_;
}

void simulator::push_all(std::vector<scheduled_event> const& events)
{
    for (auto const& ev : events) {
        scheduler_.push(ev);
    }
}

//=================================================================================================
// Main loop
//=================================================================================================

void simulator::run()
{
    BOOST_LOG_TRIVIAL(info) << "Simulation started: " << config_.to_string()
                            << ", " << client_.size() << " client and "
                            << server_.size() << " server machines";
    while (run_step()) {}
    BOOST_LOG_TRIVIAL(info) << "Simulation completed at " << current_clock_
                            << " after " << iterations_ << " steps, "
                            << recorder_.size() << " events recorded";
}

void simulator::start()
{
    started_ = true;
    scheduled_event const* first = scheduler_.peek();
    if (first) {
        current_clock_ = first->time;
    }

    // Instances start before any traffic, each seeing only its own MachineStart.
    for (auto const& ev : client_.start(current_clock_)) {
        dispatch(client_, ev);
    }
    for (auto const& ev : server_.start(current_clock_)) {
        dispatch(server_, ev);
    }
}

bool simulator::run_step()
{
    if (halted_) {
        return false;
    }
    if (!started_) {
        start();
    }

    if (config_.max_iterations and iterations_ >= config_.max_iterations)
    {
        BOOST_LOG_TRIVIAL(warning) << "Simulation stopped after " << iterations_ << " iterations";
        halted_ = true;
        return false;
    }

    scheduled_event const* next = scheduler_.peek();
    if (!next) {
        halted_ = true;
        return false;
    }
    if (limit_reached_at_ and (!config_.settle_after_limit or next->time != *limit_reached_at_)) {
        halted_ = true;
        return false;
    }

    scheduled_event ev = *scheduler_.pop_earliest();
    ++iterations_;

    BOOST_ASSERT(ev.time >= current_clock_);
    // Move the virtual clock forward to this event
    current_clock_ = ev.time;

    process(ev);

    if (limit_reached_at_ and !config_.settle_after_limit) {
        halted_ = true;
    }
    return !halted_;
}

//=================================================================================================
// Event processing
//=================================================================================================

void simulator::process(scheduled_event const& ev)
{
    machine_host& host = host_for(ev.side);

    switch (ev.origin)
    {
        case event_origin::base_trace:
            if (ev.event.is_send() and must_wait(host, ev))
            {
                BOOST_LOG_TRIVIAL(debug) << "Holding " << ev;
                if (ev.event.kind == event_kind::non_padding_sent) {
                    rerouted_.insert(ev.trace_index);
                }
                host.hold(ev);
                return;
            }
            if (ev.event.is_recv() and rerouted_.count(ev.trace_index))
            {
                BOOST_LOG_TRIVIAL(debug) << "Dropping receive of rerouted send " << ev;
                return;
            }
            // Padding comes through here once released from the held queue.
            if (ev.event.kind == event_kind::padding_sent) {
                send_padding(host, ev);
            } else {
                dispatch(host, ev);
            }
            break;

        case event_origin::network:
            dispatch(host, ev);
            break;

        case event_origin::machine:
            process_machine_event(host, ev);
            // Held sends go out once the endpoint stops blocking.
            if (!host.is_blocking(ev.time) and host.has_held()) {
                push_all(host.release_blocked(ev.time));
            }
            break;
    }
}

void simulator::process_machine_event(machine_host& host, scheduled_event const& ev)
{
    machine_id machine = ev.event.machine;

    switch (ev.event.kind)
    {
        case event_kind::padding_sent:
            if (!host.is_current(machine, ev.generation)) {
                BOOST_LOG_TRIVIAL(debug) << "Discarding stale " << ev;
                return;
            }
            host.fired(machine, ev.event);
            if (must_wait(host, ev))
            {
                BOOST_LOG_TRIVIAL(debug) << "Holding " << ev;
                host.hold(ev);
                return;
            }
            send_padding(host, ev);
            break;

        case event_kind::blocking_begin:
        {
            if (!host.is_current(machine, ev.generation)) {
                BOOST_LOG_TRIVIAL(debug) << "Discarding stale " << ev;
                return;
            }
            host.fired(machine, ev.event);
            if (!host.begin_blocking(machine, ev.time, ev.event.duration, ev.bypass, ev.replace)) {
                return;
            }
            dispatch(host, ev);

            scheduled_event end = ev;
            end.time = ev.time + ev.event.duration;
            end.event = trigger_event::blocking_end(machine);
            scheduler_.push(end);
            break;
        }

        case event_kind::blocking_end:
            if (!host.end_blocking(machine, ev.time)) {
                BOOST_LOG_TRIVIAL(debug) << "Ignoring replaced " << ev;
                return;
            }
            dispatch(host, ev);
            break;

        case event_kind::machine_start:
        case event_kind::machine_stop:
            dispatch(host, ev);
            break;

        default:
            throw std::logic_error("machine scheduled a packet receive");
    }
}

void simulator::send_padding(machine_host& host, scheduled_event const& ev)
{
    if (ev.replace)
    {
        if (host.sent_recently(ev.time, ev.event.bytes))
        {
            BOOST_LOG_TRIVIAL(debug) << "Replacing " << ev << " with the last packet sent";
            dispatch(host, ev, false);
            return;
        }

        // The next send of this endpoint stands in for the padding if it is
        // real traffic due within the replace window. It keeps its own slot.
        if (!host.is_blocking(ev.time))
        {
            bool seen_send = false;
            scheduled_event const* queued = scheduler_.find_first(
                ev.time + machine_host::replace_window(),
                [&](scheduled_event const& q) {
                    if (seen_send or q.side != ev.side or q.origin != event_origin::base_trace
                        or !q.event.is_send()) {
                        return false;
                    }
                    seen_send = true;
                    return q.event.kind == event_kind::non_padding_sent
                        and q.event.bytes <= ev.event.bytes;
                });
            if (queued)
            {
                BOOST_LOG_TRIVIAL(debug) << "Replacing " << ev << " with queued " << *queued;
                dispatch(host, ev, false);
                return;
            }
        }
    }
    dispatch(host, ev);
}

void simulator::dispatch(machine_host& host, scheduled_event const& ev, bool on_wire)
{
    BOOST_LOG_TRIVIAL(debug) << "Dispatching " << ev;

    on_dispatch(ev);

    if (!limit_reached_at_ and recorder_.record(ev, on_wire) and recorder_.full()) {
        limit_reached_at_ = ev.time;
        BOOST_LOG_TRIVIAL(debug) << "Event limit " << recorder_.limit() << " reached";
    }

    push_all(host.notify(ev.event, ev.time));

    if (!on_wire or !ev.event.is_send()) {
        return;
    }
    host.sent(ev.time, ev.event.bytes);

    // Sends created or held during the run cross the network here, the rest
    // had their receive baked into the trace.
    bool prebaked = ev.event.kind == event_kind::non_padding_sent
        and ev.origin == event_origin::base_trace and !rerouted_.count(ev.trace_index);
    if (!prebaked) {
        scheduler_.push(network_.deliver(ev.event, ev.side, ev.time));
    }
}

//=================================================================================================
// Entry point
//=================================================================================================

std::vector<recorded_packet> simulate(std::vector<trace_record> const& records,
                                      machine_list const& client_machines,
                                      machine_list const& server_machines,
                                      sim_config const& config)
{
    simulator sim(config, client_machines, server_machines);
    sim.load(ingest_trace(records, config.delay, simulation_epoch()));
    sim.run();
    return sim.take_trace();
}

} // simulation namespace
} // padsim namespace
