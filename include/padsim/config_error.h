//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <stdexcept>
#include <string>

namespace padsim {

/**
 * Raised when a trace, a machine definition or the simulation parameters
 * are rejected. Always thrown before the first event is dispatched.
 */
class config_error : public std::runtime_error
{
public:
    explicit config_error(std::string const& what)
        : std::runtime_error(what)
    {}
};

} // padsim namespace
