//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <boost/format.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "padsim/simulation/sim_config.h"
#include "padsim/config_error.h"

namespace padsim {
namespace simulation {

void sim_config::validate() const
{
    if (delay.is_special() or delay.is_negative()) {
        throw config_error("network delay must be a non-negative duration");
    }
    if (limit == 0) {
        throw config_error("event limit must be positive");
    }
}

std::string sim_config::to_string() const
{
    return boost::str(boost::format("delay %1%, limit %2%%3%, iterations %4%, %5%%6%, seed %7%")
        % boost::posix_time::to_simple_string(delay)
        % limit
        % (settle_after_limit ? " (settling)" : "")
        % (max_iterations ? std::to_string(max_iterations) : std::string("unlimited"))
        % (network_only ? "network events" : "all events")
        % (client_only ? " at client" : "")
        % seed);
}

} // simulation namespace
} // padsim namespace
