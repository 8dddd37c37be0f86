//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <boost/log/trivial.hpp>

namespace padsim {
namespace logging {

/// Drop log records below the given severity.
void set_verbosity(boost::log::trivial::severity_level level);

} // logging namespace
} // padsim namespace
