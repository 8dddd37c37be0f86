//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <string>
#include "padsim/types.h"

namespace padsim {
namespace simulation {

/**
 * Parameters of one simulation run.
 */
struct sim_config
{
    /// One-way propagation delay between client and server.
    sim_duration delay{boost::posix_time::milliseconds(10)};
    /// Number of events to record before the run stops.
    std::size_t limit{100};
    /// After the limit is hit keep dispatching events due at the same instant, unrecorded.
    bool settle_after_limit{false};
    /// Stop after this many loop iterations, 0 for no cap.
    std::size_t max_iterations{0};
    /// Record only packets, skip blocking and machine control events.
    bool network_only{true};
    /// Record only events at the client.
    bool client_only{false};
    /// Seed of the machine hosts' random generators.
    uint64_t seed{0};

    /// Throws config_error on unusable parameters.
    void validate() const;

    std::string to_string() const;
};

} // simulation namespace
} // padsim namespace
