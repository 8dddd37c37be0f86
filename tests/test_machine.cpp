//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#define BOOST_TEST_MODULE Test_machine
#include <boost/test/unit_test.hpp>
#include <cmath>

#include "simulator_fixture.h"
#include "padsim/config_error.h"
#include "padsim/machine_instance.h"

using namespace std;
using namespace padsim;

BOOST_TEST_GLOBAL_FIXTURE(quiet_logging);

struct instance_fixture
{
    boost::random::mt19937 rng{7};
    sim_time now{simulation_epoch()};
};

//=================================================================================================
// Distributions
//=================================================================================================

BOOST_AUTO_TEST_CASE(dist_samples_stay_in_bounds)
{
    boost::random::mt19937 rng(1);

    BOOST_CHECK_EQUAL(dist().sample(rng), 0.0);
    BOOST_CHECK_EQUAL(dist::fixed(250).sample(rng), 250.0);
    BOOST_CHECK_EQUAL(dist::normal(10, 0).sample(rng), 10.0);

    dist capped = dist::uniform(0, 1000);
    capped.max = 100;
    dist shifted = dist::normal(-50, 10);
    dist offset = dist::exponential(1.0);
    offset.start = 500;

    for (int i = 0; i < 1000; ++i)
    {
        double u = dist::uniform(10, 20).sample(rng);
        BOOST_CHECK(u >= 10.0 and u < 20.0);
        BOOST_CHECK(capped.sample(rng) <= 100.0);
        BOOST_CHECK_EQUAL(shifted.sample(rng), 0.0);
        BOOST_CHECK(offset.sample(rng) >= 500.0);
    }
}

BOOST_AUTO_TEST_CASE(dist_rejects_bad_parameters)
{
    BOOST_CHECK_THROW(dist::uniform(5, 1).validate(), config_error);
    BOOST_CHECK_THROW(dist::normal(0, -1).validate(), config_error);
    BOOST_CHECK_THROW(dist::exponential(0).validate(), config_error);
    dist negative;
    negative.max = -1;
    BOOST_CHECK_THROW(negative.validate(), config_error);
    BOOST_CHECK_NO_THROW(dist::lognormal(1, 0.5).validate());
}

//=================================================================================================
// Machine definition
//=================================================================================================

BOOST_AUTO_TEST_CASE(machine_validation)
{
    BOOST_CHECK_THROW(machine().validate(), config_error);

    state dangling;
    dangling.on(event_kind::non_padding_sent, 3);
    BOOST_CHECK_THROW(machine(vector<state>{dangling}).validate(), config_error);

    state overfull;
    overfull.on(event_kind::non_padding_sent, 0, 0.6).on(event_kind::non_padding_sent, 0, 0.6);
    BOOST_CHECK_THROW(machine(vector<state>{overfull}).validate(), config_error);

    state negative;
    negative.on(event_kind::non_padding_recv, 0, -0.1);
    BOOST_CHECK_THROW(machine(vector<state>{negative}).validate(), config_error);

    state bad_timeout(action_kind::pad);
    bad_timeout.timeout = dist::uniform(10, 1);
    BOOST_CHECK_THROW(machine(vector<state>{bad_timeout}).validate(), config_error);

    state stopper;
    stopper.on(event_kind::non_padding_sent, machine::stop_state, 0.3)
           .on(event_kind::non_padding_sent, 0, 0.7);
    // Unreachable state 1 is only a warning.
    BOOST_CHECK_NO_THROW(machine(vector<state>{stopper, state()}).validate());
}

BOOST_AUTO_TEST_CASE(durations_stay_in_clock_range)
{
    sim_duration longest = microseconds_to_duration(max_duration_usec);
    BOOST_CHECK(longest > boost::posix_time::hours(24 * 365 * 30));
    BOOST_CHECK(microseconds_to_duration(1e19) == longest);
    BOOST_CHECK(microseconds_to_duration(1e300) == longest);
    BOOST_CHECK(microseconds_to_duration(-5) == boost::posix_time::microseconds(0));
    BOOST_CHECK(microseconds_to_duration(std::nan("")) == boost::posix_time::microseconds(0));
    BOOST_CHECK(microseconds_to_duration(2.6) == boost::posix_time::microseconds(3));
    BOOST_CHECK(!(simulation_epoch() + longest).is_special());
}

//=================================================================================================
// Machine instance
//=================================================================================================

BOOST_FIXTURE_TEST_CASE(instance_rejects_invalid_definition, instance_fixture)
{
    BOOST_CHECK_THROW(machine_instance inst(make_shared<const machine>()), config_error);
    BOOST_CHECK_THROW(machine_instance inst(nullptr), config_error);
}

BOOST_FIXTURE_TEST_CASE(instance_arms_padding, instance_fixture)
{
    machine_instance inst(padding_machine(8, dist::fixed(600)));
    BOOST_CHECK_EQUAL(inst.current_state(), 0u);

    BOOST_CHECK(!inst.evaluate(trigger_event::non_padding_recv(10), now, rng));

    auto a = inst.evaluate(trigger_event::non_padding_sent(10), now, rng);
    BOOST_REQUIRE(a);
    BOOST_CHECK(a->type == action::kind::pad);
    BOOST_CHECK_EQUAL(a->bytes, 600u);
    BOOST_CHECK(a->at == now + boost::posix_time::microseconds(8));
    BOOST_CHECK_EQUAL(inst.current_state(), 1u);
    BOOST_CHECK(inst.is_current(a->generation));

    inst.fired(trigger_event::padding_sent(600, 0));
    BOOST_CHECK(!inst.is_current(a->generation));
    BOOST_CHECK_EQUAL(inst.padding_spent(), 600u);
}

BOOST_FIXTURE_TEST_CASE(transition_cancels_pending_action, instance_fixture)
{
    state s0;
    s0.on(event_kind::non_padding_sent, 1);
    state s1(action_kind::pad);
    s1.timeout = dist::fixed(100);
    s1.on(event_kind::non_padding_recv, 0);
    machine_instance inst(make_shared<const machine>(vector<state>{s0, s1}));

    auto a = inst.evaluate(trigger_event::non_padding_sent(1), now, rng);
    BOOST_REQUIRE(a);
    BOOST_CHECK(!inst.evaluate(trigger_event::non_padding_recv(1), now, rng));
    BOOST_CHECK(!inst.is_current(a->generation));
    BOOST_CHECK(!inst.pending());
    BOOST_CHECK_EQUAL(inst.current_state(), 0u);
}

BOOST_FIXTURE_TEST_CASE(state_limit_caps_actions, instance_fixture)
{
    state s0;
    s0.on(event_kind::non_padding_sent, 1);
    state s1(action_kind::pad);
    s1.limit = dist::fixed(2);
    s1.on(event_kind::padding_sent, 1);
    machine_instance inst(make_shared<const machine>(vector<state>{s0, s1}));

    auto a = inst.evaluate(trigger_event::non_padding_sent(1), now, rng);
    BOOST_REQUIRE(a);
    inst.fired(trigger_event::padding_sent(a->bytes, 0));
    a = inst.evaluate(trigger_event::padding_sent(1420, 0), now, rng);
    BOOST_REQUIRE(a);
    inst.fired(trigger_event::padding_sent(a->bytes, 0));
    BOOST_CHECK(!inst.evaluate(trigger_event::padding_sent(1420, 0), now, rng));
    BOOST_CHECK_EQUAL(inst.padding_spent(), 2u * machine::default_padding_size);
}

BOOST_FIXTURE_TEST_CASE(padding_budget_caps_actions, instance_fixture)
{
    auto def = make_shared<machine>(*padding_machine(0, dist::fixed(1000)));
    def->padding_budget = 1500;
    machine_instance inst(def);

    auto a = inst.evaluate(trigger_event::non_padding_sent(1), now, rng);
    BOOST_REQUIRE(a);
    inst.fired(trigger_event::padding_sent(a->bytes, 0));
    BOOST_CHECK(!inst.evaluate(trigger_event::padding_sent(1000, 0), now, rng));
}

BOOST_FIXTURE_TEST_CASE(blocking_budget_caps_actions, instance_fixture)
{
    auto def = make_shared<machine>(*blocking_machine(0, 10));
    def->blocking_budget = boost::posix_time::microseconds(15);
    machine_instance inst(def);

    auto a = inst.evaluate(trigger_event::non_padding_sent(1), now, rng);
    BOOST_REQUIRE(a);
    BOOST_CHECK(a->type == action::kind::block);
    inst.fired(trigger_event::blocking_begin(0, a->duration));
    BOOST_CHECK(inst.begin_blocking(now, a->duration));
    BOOST_CHECK(inst.blocking_spent() == boost::posix_time::microseconds(10));

    // Another 10us would take the total to 20us, over the budget.
    sim_time end = now + a->duration;
    BOOST_CHECK(inst.end_blocking(end));
    BOOST_CHECK(!inst.evaluate(trigger_event::blocking_end(0), end, rng));
    BOOST_CHECK(!inst.pending());
    BOOST_CHECK_EQUAL(inst.current_state(), 1u);
    BOOST_CHECK(inst.blocking_spent() == boost::posix_time::microseconds(10));
}

BOOST_FIXTURE_TEST_CASE(state_flags_reach_the_action, instance_fixture)
{
    state s0;
    s0.on(event_kind::non_padding_sent, 1);
    state s1(action_kind::pad);
    s1.bypass = true;
    s1.replace = true;
    machine_instance inst(make_shared<const machine>(vector<state>{s0, s1}));

    auto a = inst.evaluate(trigger_event::non_padding_sent(1), now, rng);
    BOOST_REQUIRE(a);
    BOOST_CHECK(a->bypass);
    BOOST_CHECK(a->replace);
}

BOOST_FIXTURE_TEST_CASE(shorter_block_only_applies_with_replace, instance_fixture)
{
    machine_instance inst(blocking_machine(0, 10));
    auto us = [](int n) { return boost::posix_time::microseconds(n); };

    BOOST_CHECK(inst.begin_blocking(now, us(20), false, false));
    BOOST_CHECK(!inst.is_bypassable());

    // Ends earlier and does not replace: the window and its flags stay.
    BOOST_CHECK(inst.begin_blocking(now + us(2), us(5), true, false));
    BOOST_CHECK(*inst.blocking_until() == now + us(20));
    BOOST_CHECK(!inst.is_bypassable());
    BOOST_CHECK(!inst.end_blocking(now + us(7)));

    // Replacing cuts the window short and takes its flags.
    BOOST_CHECK(inst.begin_blocking(now + us(3), us(5), true, true));
    BOOST_CHECK(*inst.blocking_until() == now + us(8));
    BOOST_CHECK(inst.is_bypassable());
    BOOST_CHECK(!inst.is_blocking(now + us(8)));
    BOOST_CHECK(!inst.end_blocking(now + us(7)));
    BOOST_CHECK(inst.end_blocking(now + us(8)));

    // Every block counts against the budget, applied or not.
    BOOST_CHECK(inst.blocking_spent() == us(30));
}

BOOST_FIXTURE_TEST_CASE(blocking_window, instance_fixture)
{
    machine_instance inst(blocking_machine(0, 10));
    auto ten = boost::posix_time::microseconds(10);

    BOOST_CHECK(!inst.begin_blocking(now, boost::posix_time::seconds(0)));
    BOOST_CHECK(!inst.is_blocking(now));

    BOOST_CHECK(inst.begin_blocking(now, ten));
    BOOST_CHECK(inst.is_blocking(now));
    BOOST_CHECK(inst.is_blocking(now + boost::posix_time::microseconds(9)));
    BOOST_CHECK(!inst.is_blocking(now + ten));

    // A block ending later extends the window, the first end is stale.
    BOOST_CHECK(inst.begin_blocking(now + boost::posix_time::microseconds(5), ten));
    BOOST_CHECK(!inst.end_blocking(now + ten));
    BOOST_CHECK(inst.end_blocking(now + boost::posix_time::microseconds(15)));
    BOOST_CHECK(!inst.blocking_until());
    BOOST_CHECK(inst.blocking_spent() == boost::posix_time::microseconds(20));
}

BOOST_FIXTURE_TEST_CASE(stop_freezes_instance, instance_fixture)
{
    state s0;
    s0.on(event_kind::non_padding_sent, machine::stop_state);
    machine_instance inst(make_shared<const machine>(vector<state>{s0}));
    inst.begin_blocking(now, boost::posix_time::microseconds(10));

    auto a = inst.evaluate(trigger_event::non_padding_sent(1), now, rng);
    BOOST_REQUIRE(a);
    BOOST_CHECK(a->type == action::kind::stop);
    BOOST_CHECK(a->at == now);
    BOOST_CHECK(!inst.active());
    BOOST_CHECK(!inst.is_blocking(now));
    BOOST_CHECK(!inst.evaluate(trigger_event::non_padding_sent(1), now, rng));
}
