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
#include <boost/date_time/posix_time/posix_time.hpp>
#include "padsim/types.h"

namespace padsim {

const double max_duration_usec = 1e15;

sim_time simulation_epoch()
{
    return boost::posix_time::from_iso_string("20000101T000000");
}

sim_duration microseconds_to_duration(double usec)
{
    if (!(usec > 0.0)) {
        return boost::posix_time::microseconds(0);
    }
    usec = std::min(usec, max_duration_usec);
    return boost::posix_time::microseconds(static_cast<int64_t>(std::llround(usec)));
}

} // padsim namespace
