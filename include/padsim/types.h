//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace padsim {

/// Absolute simulated time. Microsecond resolution.
using sim_time = boost::posix_time::ptime;
/// Simulated interval.
using sim_duration = boost::posix_time::time_duration;

/// Index of a machine within the machine list of its endpoint.
using machine_id = std::size_t;

/**
 * Fixed instant all simulations start from, so that absolute times in
 * two runs of the same input compare equal.
 */
sim_time simulation_epoch();

/**
 * Longest interval a machine can ask for, a little under 32 years. Anything
 * longer is cut to it so the clock stays inside the ptime range.
 */
extern const double max_duration_usec;

/**
 * Convert a duration expressed in (fractional) microseconds.
 * Negative and NaN inputs give zero, large ones are cut to max_duration_usec.
 */
sim_duration microseconds_to_duration(double usec);

} // padsim namespace
