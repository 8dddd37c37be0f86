//
// Part of Metta OS. Check http://atta-metta.net for latest version.
//
// Copyright 2007 - 2014, Stanislav Karchebnyy <berkus@atta-metta.net>
//
// Distributed under the Boost Software License, Version 1.0.
// (See file LICENSE_1_0.txt or a copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/trivial.hpp>
#include "padsim/trace_record.h"
#include "padsim/config_error.h"

namespace padsim {

namespace {

/// Size assumed for lines that carry no size column (typical MTU-sized cell).
const int64_t default_packet_size = 1420;

[[noreturn]] void malformed(std::size_t line_no, std::string const& line, std::string const& why)
{
    throw config_error(boost::str(boost::format("trace line %d \"%s\": %s") % line_no % line % why));
}

} // anonymous namespace

std::vector<trace_record> parse_trace(std::string const& text)
{
    std::vector<trace_record> records;
    std::vector<std::string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));

    std::size_t line_no = 0;
    for (auto line : lines)
    {
        ++line_no;
        boost::trim(line);
        if (line.empty()) {
            continue;
        }

        std::vector<std::string> parts;
        boost::split(parts, line, boost::is_any_of(","));
        for (auto& part : parts) {
            boost::trim(part);
        }
        if (parts.size() < 2 or parts.size() > 3) {
            malformed(line_no, line, "expected time,direction[,size]");
        }

        trace_record record;
        try {
            int64_t nsec = boost::lexical_cast<int64_t>(parts[0]);
            record.time = boost::posix_time::microseconds(nsec / 1000);
            record.size = parts.size() == 3 ? boost::lexical_cast<int64_t>(parts[2])
                                            : default_packet_size;
        } catch (boost::bad_lexical_cast const&) {
            malformed(line_no, line, "not a number");
        }

        std::string const& dir = parts[1];
        if (dir == "s" or dir == "sn") {
            record.dir = direction::sent;
        } else if (dir == "r" or dir == "rn") {
            record.dir = direction::received;
        } else if (dir == "sp" or dir == "rp") {
            BOOST_LOG_TRIVIAL(debug) << "Skipping captured padding on trace line " << line_no;
            continue;
        } else {
            malformed(line_no, line, "invalid direction");
        }

        records.push_back(record);
    }

    return records;
}

} // padsim namespace
