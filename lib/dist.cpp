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
#include <boost/format.hpp>
#include <boost/random/exponential_distribution.hpp>
#include <boost/random/lognormal_distribution.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include "padsim/dist.h"
#include "padsim/config_error.h"

namespace padsim {

dist dist::uniform(double low, double high)
{
    dist d;
    d.kind = type::uniform;
    d.param1 = low;
    d.param2 = high;
    return d;
}

dist dist::normal(double mean, double stddev)
{
    dist d;
    d.kind = type::normal;
    d.param1 = mean;
    d.param2 = stddev;
    return d;
}

dist dist::lognormal(double m, double s)
{
    dist d;
    d.kind = type::lognormal;
    d.param1 = m;
    d.param2 = s;
    return d;
}

dist dist::exponential(double lambda)
{
    dist d;
    d.kind = type::exponential;
    d.param1 = lambda;
    return d;
}

void dist::validate() const
{
    if (!std::isfinite(param1) or !std::isfinite(param2)
        or !std::isfinite(start) or !std::isfinite(max)) {
        throw config_error("distribution " + to_string() + " has non-finite parameters");
    }
    if (start < 0.0 or max < 0.0) {
        throw config_error("distribution " + to_string() + " has negative start or max");
    }
    switch (kind)
    {
        case type::none:
            break;
        case type::uniform:
            if (param1 > param2) {
                throw config_error("uniform distribution " + to_string() + " has low > high");
            }
            break;
        case type::normal:
        case type::lognormal:
            if (param2 < 0.0) {
                throw config_error("distribution " + to_string() + " has negative spread");
            }
            break;
        case type::exponential:
            if (param1 <= 0.0) {
                throw config_error("exponential distribution " + to_string() + " needs lambda > 0");
            }
            break;
    }
}

double dist::sample(boost::random::mt19937& rng) const
{
    double draw = 0.0;
    switch (kind)
    {
        case type::none:
            break;
        case type::uniform:
            // uniform_real_distribution never returns its upper bound and spins on an empty range.
            draw = (param1 == param2)
                 ? param1
                 : boost::random::uniform_real_distribution<double>(param1, param2)(rng);
            break;
        case type::normal:
            draw = (param2 == 0.0)
                 ? param1
                 : boost::random::normal_distribution<double>(param1, param2)(rng);
            break;
        case type::lognormal:
            draw = (param2 == 0.0)
                 ? std::exp(param1)
                 : boost::random::lognormal_distribution<double>(param1, param2)(rng);
            break;
        case type::exponential:
            draw = boost::random::exponential_distribution<double>(param1)(rng);
            break;
    }

    double value = std::max(0.0, start + draw);
    if (max > 0.0) {
        value = std::min(value, max);
    }
    return value;
}

std::string dist::to_string() const
{
    static const char* names[] = { "none", "uniform", "normal", "lognormal", "exponential" };
    return boost::str(boost::format("%s(%g, %g; start %g, max %g)")
        % names[static_cast<int>(kind)] % param1 % param2 % start % max);
}

} // padsim namespace
