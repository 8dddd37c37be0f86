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
#include <vector>
#include "padsim/types.h"

namespace padsim {

/// Direction of a captured packet, seen from the client.
enum class direction : uint8_t
{
    sent,
    received,
};

/**
 * One packet of a base trace as captured at the client.
 * Size is signed so that ingestion can reject negative values coming from parsers.
 */
struct trace_record
{
    sim_duration time;      ///< Relative to the start of the capture.
    direction dir{direction::sent};
    int64_t size{0};
};

/**
 * Parse a textual capture into trace records.
 *
 * One packet per line, "time,direction[,size]". Time is in nanoseconds since the
 * start of the capture, direction is "s"/"sn" for sent and "r"/"rn" for received.
 * Padding already present in the capture ("sp", "rp") is skipped.
 * Throws config_error on the first malformed line.
 */
std::vector<trace_record> parse_trace(std::string const& text);

} // padsim namespace
