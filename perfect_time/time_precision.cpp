//
// time_precision.cpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "time_precision.hpp"

#include <array>
#include <boost/spirit/include/qi_eoi.hpp>
#include <boost/spirit/include/qi_parse.hpp>
#include <boost/spirit/include/qi_sequence.hpp>
#include <boost/spirit/include/qi_symbols.hpp>
#include <cstddef>
#include <vector>

namespace perfect_time
{
    namespace
    {
        struct unit_constants
        {
            const char* name;
            const char* per_second;
            const char* seconds_per;
        };

        // Ordered as the enumeration
        const std::array<unit_constants, 10> units = {{
            {
                "millennia",
                "0.000000000031688738506811430964562103462970695015158624952118",
                "31556952000"
            },
            {
                "centuries",
                "0.000000000316887385068114309645621034629706950151586249521183",
                "3155695200"
            },
            {
                "years",
                "0.000000031688738506811430964562103462970695015158624952118316",
                "31556952"
            },
            {
                "days",
                "0.000011574074074074074074074074074074074074074074074074074074",
                "86400"
            },
            {"seconds", "1", "1"},
            {"milliseconds", "1000", "0.001"},
            {"microseconds", "1000000", "0.000001"},
            {"nanoseconds", "1000000000", "0.000000001"},
            {"femtoseconds", "1000000000000000", "0.000000000000001"},
            {"attoseconds", "1000000000000000000", "0.000000000000000001"}
        }};

        const unit_constants& lookup(const time_precision unit)
        {
            return units.at(static_cast<std::size_t>(unit));
        }

        std::vector<decimal> make_per_second_values()
        {
            std::vector<decimal> values;
            values.reserve(units.size());
            for (const unit_constants& constants : units)
            {
                values.push_back(
                    decimal::parse(constants.per_second).rescale(working_precision));
            }
            return values;
        }

        std::vector<decimal> make_seconds_per_values()
        {
            std::vector<decimal> values;
            values.reserve(units.size());
            for (const unit_constants& constants : units)
            {
                values.push_back(decimal::parse(constants.seconds_per));
            }
            return values;
        }

        struct unit_names : boost::spirit::qi::symbols<char, time_precision>
        {
            unit_names()
            {
                add
                    ("millennia", time_precision::millennia)
                    ("millennium", time_precision::millennia)
                    ("centuries", time_precision::centuries)
                    ("century", time_precision::centuries)
                    ("years", time_precision::years)
                    ("year", time_precision::years)
                    ("days", time_precision::days)
                    ("day", time_precision::days)
                    ("seconds", time_precision::seconds)
                    ("second", time_precision::seconds)
                    ("s", time_precision::seconds)
                    ("milliseconds", time_precision::milliseconds)
                    ("millisecond", time_precision::milliseconds)
                    ("ms", time_precision::milliseconds)
                    ("microseconds", time_precision::microseconds)
                    ("microsecond", time_precision::microseconds)
                    ("us", time_precision::microseconds)
                    ("nanoseconds", time_precision::nanoseconds)
                    ("nanosecond", time_precision::nanoseconds)
                    ("ns", time_precision::nanoseconds)
                    ("femtoseconds", time_precision::femtoseconds)
                    ("femtosecond", time_precision::femtoseconds)
                    ("fs", time_precision::femtoseconds)
                    ("attoseconds", time_precision::attoseconds)
                    ("attosecond", time_precision::attoseconds)
                    ("as", time_precision::attoseconds);
            }
        };
    }

    const char* per_second(const time_precision unit)
    {
        return lookup(unit).per_second;
    }

    const char* seconds_per(const time_precision unit)
    {
        return lookup(unit).seconds_per;
    }

    const decimal& per_second_value(const time_precision unit)
    {
        static const std::vector<decimal> values = make_per_second_values();
        return values.at(static_cast<std::size_t>(unit));
    }

    const decimal& seconds_per_value(const time_precision unit)
    {
        static const std::vector<decimal> values = make_seconds_per_values();
        return values.at(static_cast<std::size_t>(unit));
    }

    const char* to_string(const time_precision unit)
    {
        return lookup(unit).name;
    }

    boost::optional<time_precision> parse_time_precision(const std::string& name)
    {
        namespace qi = boost::spirit::qi;

        static unit_names names;

        time_precision unit = time_precision::seconds;
        std::string::const_iterator first = name.begin();
        if (qi::parse(first, name.end(), (names >> qi::eoi), unit))
        {
            return unit;
        }
        return boost::none;
    }
}
