//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <algorithm>
#include <limits>
#include <boost/format.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>
#include "padsim/simulation/trace_ingestor.h"
#include "padsim/config_error.h"

namespace padsim {
namespace simulation {

namespace {

scheduled_event base_event(sim_time time, endpoint side, trigger_event ev, std::size_t index)
{
    scheduled_event result;
    result.time = time;
    result.side = side;
    result.event = ev;
    result.origin = event_origin::base_trace;
    result.trace_index = index;
    return result;
}

} // anonymous namespace

std::vector<scheduled_event> ingested_trace::merged() const
{
    std::vector<scheduled_event> all;
    all.reserve(client.size() + server.size());
    all.insert(all.end(), client.begin(), client.end());
    all.insert(all.end(), server.begin(), server.end());

    std::stable_sort(all.begin(), all.end(),
        [](scheduled_event const& a, scheduled_event const& b) {
            if (a.time != b.time) {
                return a.time < b.time;
            }
            if (a.trace_index != b.trace_index) {
                return a.trace_index < b.trace_index;
            }
            return a.event.is_send() and !b.event.is_send();
        });
    return all;
}

ingested_trace ingest_trace(std::vector<trace_record> const& records,
                            sim_duration delay, sim_time origin)
{
    if (records.empty()) {
        throw config_error("empty trace");
    }
    if (delay.is_special() or delay.is_negative()) {
        throw config_error("network delay must be a non-negative duration");
    }

    ingested_trace result;
    result.client.reserve(records.size());
    result.server.reserve(records.size());

    sim_duration previous = boost::posix_time::seconds(0);
    for (std::size_t i = 0; i < records.size(); ++i)
    {
        trace_record const& rec = records[i];
        if (rec.time.is_special() or rec.time.is_negative()) {
            throw config_error(boost::str(boost::format("trace record %d has a negative timestamp") % i));
        }
        if (rec.time < previous) {
            throw config_error(boost::str(boost::format("trace record %d goes back in time (%s < %s)")
                % i
                % boost::posix_time::to_simple_string(rec.time)
                % boost::posix_time::to_simple_string(previous)));
        }
        if (rec.size < 0 or rec.size > std::numeric_limits<uint32_t>::max()) {
            throw config_error(boost::str(boost::format("trace record %d has invalid size %d") % i % rec.size));
        }
        previous = rec.time;

        uint32_t bytes = static_cast<uint32_t>(rec.size);
        sim_time at = origin + rec.time;

        if (rec.dir == direction::sent)
        {
            result.client.push_back(
                base_event(at, endpoint::client, trigger_event::non_padding_sent(bytes), i));
            result.server.push_back(
                base_event(at + delay, endpoint::server, trigger_event::non_padding_recv(bytes), i));
        }
        else
        {
            result.client.push_back(
                base_event(at, endpoint::client, trigger_event::non_padding_recv(bytes), i));
            result.server.push_back(
                base_event(at - delay, endpoint::server, trigger_event::non_padding_sent(bytes), i));
        }
    }

    // The server sees sends early and receives late, so its view needs sorting.
    std::stable_sort(result.server.begin(), result.server.end(),
        [](scheduled_event const& a, scheduled_event const& b) { return a.time < b.time; });

    BOOST_LOG_TRIVIAL(debug) << "Ingested " << records.size() << " trace records";
    return result;
}

} // simulation namespace
} // padsim namespace
