//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <limits>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include "padsim/machine.h"
#include "padsim/config_error.h"

namespace padsim {

const std::size_t machine::stop_state = std::numeric_limits<std::size_t>::max();
const uint32_t machine::default_padding_size = 1420;

// Tolerance for probabilities written as decimal fractions.
static const double probability_epsilon = 1e-9;

state& state::on(event_kind ev, std::size_t target, double probability)
{
    transitions[ev].push_back(transition{target, probability});
    return *this;
}

void machine::validate() const
{
    if (states.empty()) {
        throw config_error("machine has no states");
    }

    for (std::size_t i = 0; i < states.size(); ++i)
    {
        state const& s = states[i];
        try {
            s.timeout.validate();
            s.action_dist.validate();
            s.limit.validate();
        } catch (config_error const& e) {
            throw config_error(boost::str(boost::format("state %d: %s") % i % e.what()));
        }

        for (auto const& entry : s.transitions)
        {
            double total = 0.0;
            for (transition const& t : entry.second)
            {
                if (t.target != stop_state and t.target >= states.size()) {
                    throw config_error(boost::str(
                        boost::format("state %d: transition on %s to undefined state %d")
                            % i % event_code(entry.first) % t.target));
                }
                if (!(t.probability >= 0.0 and t.probability <= 1.0)) {
                    throw config_error(boost::str(
                        boost::format("state %d: transition on %s has probability %g")
                            % i % event_code(entry.first) % t.probability));
                }
                total += t.probability;
            }
            if (total > 1.0 + probability_epsilon) {
                throw config_error(boost::str(
                    boost::format("state %d: transitions on %s add up to %g")
                        % i % event_code(entry.first) % total));
            }
        }
    }

    // Walk the graph from the start state.
    std::vector<bool> reachable(states.size(), false);
    std::vector<std::size_t> pending{0};
    reachable[0] = true;
    while (!pending.empty())
    {
        std::size_t current = pending.back();
        pending.pop_back();
        for (auto const& entry : states[current].transitions) {
            for (transition const& t : entry.second) {
                if (t.target != stop_state and t.probability > 0.0 and !reachable[t.target]) {
                    reachable[t.target] = true;
                    pending.push_back(t.target);
                }
            }
        }
    }

    for (std::size_t i = 0; i < states.size(); ++i)
    {
        if (!reachable[i]) {
            BOOST_LOG_TRIVIAL(warning) << "Machine state " << i << " is unreachable";
        }
    }
}

} // padsim namespace
