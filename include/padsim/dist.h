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
#include <boost/random/mersenne_twister.hpp>

namespace padsim {

/**
 * Bounded random distribution used by machine states for timeouts,
 * padding sizes, block durations and action limits.
 *
 * A sample is start + draw, never negative, and clamped to max when max is positive.
 */
struct dist
{
    enum class type : uint8_t
    {
        none,        ///< Not set, samples to start.
        uniform,     ///< param1 = low, param2 = high
        normal,      ///< param1 = mean, param2 = standard deviation
        lognormal,   ///< param1 = m, param2 = s
        exponential, ///< param1 = lambda
    };

    type kind{type::none};
    double param1{0.0};
    double param2{0.0};
    double start{0.0};
    double max{0.0};

    static dist fixed(double value) { return uniform(value, value); }
    static dist uniform(double low, double high);
    static dist normal(double mean, double stddev);
    static dist lognormal(double m, double s);
    static dist exponential(double lambda);

    bool is_set() const { return kind != type::none; }

    /// Throws config_error on parameters that cannot be sampled.
    void validate() const;

    double sample(boost::random::mt19937& rng) const;

    std::string to_string() const;
};

} // padsim namespace
