//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#define BOOST_TEST_MODULE Test_network
#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include "padsim/config_error.h"
#include "padsim/simulation/network.h"

using namespace std;
using namespace padsim;
using namespace padsim::simulation;

BOOST_AUTO_TEST_CASE(delivers_to_the_other_endpoint)
{
    network link(boost::posix_time::milliseconds(10));
    sim_time now = simulation_epoch();

    scheduled_event arrival = link.deliver(trigger_event::non_padding_sent(100), endpoint::client, now);
    BOOST_CHECK(arrival.side == endpoint::server);
    BOOST_CHECK(arrival.origin == event_origin::network);
    BOOST_CHECK(arrival.time == now + boost::posix_time::milliseconds(10));
    BOOST_CHECK(arrival.event == trigger_event::non_padding_recv(100));

    arrival = link.deliver(trigger_event::padding_sent(1420, 2), endpoint::server, now);
    BOOST_CHECK(arrival.side == endpoint::client);
    BOOST_CHECK(arrival.event == trigger_event::padding_recv(1420, 2));
}

BOOST_AUTO_TEST_CASE(zero_delay_arrives_immediately)
{
    network link(boost::posix_time::seconds(0));
    sim_time now = simulation_epoch();
    BOOST_CHECK(link.deliver(trigger_event::non_padding_sent(1), endpoint::client, now).time == now);
}

BOOST_AUTO_TEST_CASE(only_sends_cross_the_link)
{
    network link(boost::posix_time::milliseconds(1));
    BOOST_CHECK_THROW(link.deliver(trigger_event::non_padding_recv(100), endpoint::client,
                                   simulation_epoch()), invalid_argument);
    BOOST_CHECK_THROW(link.deliver(trigger_event::blocking_end(0), endpoint::client,
                                   simulation_epoch()), invalid_argument);
}

BOOST_AUTO_TEST_CASE(rejects_negative_delay)
{
    BOOST_CHECK_THROW(network link(boost::posix_time::milliseconds(-1)), config_error);

    sim_duration invalid(boost::posix_time::not_a_date_time);
    BOOST_CHECK_THROW(network link(invalid), config_error);
}
