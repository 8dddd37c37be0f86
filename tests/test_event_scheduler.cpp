//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#define BOOST_TEST_MODULE Test_event_scheduler
#include <boost/test/unit_test.hpp>

#include "padsim/simulation/event_scheduler.h"

using namespace std;
using namespace padsim;
using namespace padsim::simulation;

namespace {

scheduled_event make_event(int64_t usec, event_origin origin, uint32_t bytes)
{
    scheduled_event ev;
    ev.time = simulation_epoch() + boost::posix_time::microseconds(usec);
    ev.origin = origin;
    ev.event = trigger_event::non_padding_sent(bytes);
    return ev;
}

} // anonymous namespace

BOOST_AUTO_TEST_CASE(empty_scheduler)
{
    event_scheduler sched;
    BOOST_CHECK(sched.empty());
    BOOST_CHECK(sched.peek() == nullptr);
    BOOST_CHECK(!sched.pop_earliest());
}

BOOST_AUTO_TEST_CASE(pops_in_time_order)
{
    event_scheduler sched;
    sched.push(make_event(30, event_origin::base_trace, 3));
    sched.push(make_event(10, event_origin::machine, 1));
    sched.push(make_event(20, event_origin::network, 2));
    BOOST_CHECK_EQUAL(sched.size(), 3u);

    BOOST_REQUIRE(sched.peek() != nullptr);
    BOOST_CHECK_EQUAL(sched.peek()->event.bytes, 1u);
    BOOST_CHECK_EQUAL(sched.pop_earliest()->event.bytes, 1u);
    BOOST_CHECK_EQUAL(sched.pop_earliest()->event.bytes, 2u);
    BOOST_CHECK_EQUAL(sched.pop_earliest()->event.bytes, 3u);
    BOOST_CHECK(sched.empty());
}

BOOST_AUTO_TEST_CASE(same_instant_breaks_ties_by_origin_then_insertion)
{
    event_scheduler sched;
    sched.push(make_event(5, event_origin::machine, 1));
    sched.push(make_event(5, event_origin::network, 2));
    sched.push(make_event(5, event_origin::base_trace, 3));
    sched.push(make_event(5, event_origin::network, 4));
    sched.push(make_event(5, event_origin::base_trace, 5));

    vector<uint32_t> order;
    while (auto ev = sched.pop_earliest()) {
        order.push_back(ev->event.bytes);
    }
    vector<uint32_t> expected{3, 5, 2, 4, 1};
    BOOST_CHECK_EQUAL_COLLECTIONS(order.begin(), order.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(push_assigns_sequence)
{
    event_scheduler sched;
    scheduled_event ev = make_event(0, event_origin::base_trace, 1);
    ev.sequence = 99;
    sched.push(ev);
    sched.push(ev);
    BOOST_CHECK_EQUAL(sched.pop_earliest()->sequence, 0u);
    BOOST_CHECK_EQUAL(sched.pop_earliest()->sequence, 1u);
}

BOOST_AUTO_TEST_CASE(find_first_walks_due_events_in_pop_order)
{
    event_scheduler sched;
    sched.push(make_event(2, event_origin::machine, 1));
    sched.push(make_event(2, event_origin::base_trace, 2));
    sched.push(make_event(1, event_origin::network, 3));
    sched.push(make_event(9, event_origin::base_trace, 4));

    sim_time until = simulation_epoch() + boost::posix_time::microseconds(2);
    auto any = [](scheduled_event const&) { return true; };
    auto odd = [](scheduled_event const& ev) { return ev.event.bytes % 2 == 1; };
    auto big = [](scheduled_event const& ev) { return ev.event.bytes >= 4; };

    BOOST_REQUIRE(sched.find_first(until, any) != nullptr);
    BOOST_CHECK_EQUAL(sched.find_first(until, any)->event.bytes, 3u);
    // Bytes 1 and 3 are both odd, 3 pops first.
    BOOST_CHECK_EQUAL(sched.find_first(until, odd)->event.bytes, 3u);
    // Bytes 4 is due too late.
    BOOST_CHECK(sched.find_first(until, big) == nullptr);

    BOOST_CHECK_EQUAL(sched.size(), 4u);
    vector<uint32_t> order;
    while (auto ev = sched.pop_earliest()) {
        order.push_back(ev->event.bytes);
    }
    vector<uint32_t> expected{3, 2, 1, 4};
    BOOST_CHECK_EQUAL_COLLECTIONS(order.begin(), order.end(), expected.begin(), expected.end());
}
