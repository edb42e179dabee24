//
// time_precision.hpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TIME_PRECISION_HPP
#define TIME_PRECISION_HPP

#include <boost/optional.hpp>
#include <string>

#include "decimal.hpp"

namespace perfect_time
{
    // Fractional digits carried through intermediate calculations
    const unsigned working_precision = 50;

    // Units a time can be expressed in. Years are average Gregorian years
    // (365.2425 days); centuries and millennia are multiples of those.
    enum class time_precision
    {
        millennia,
        centuries,
        years,
        days,
        seconds,
        milliseconds,
        microseconds,
        nanoseconds,
        femtoseconds,
        attoseconds
    };

    // Exact count of unit per second, as decimal text. Repeating values
    // are written out well past working_precision.
    const char* per_second(time_precision unit);

    // Exact count of seconds per unit, as decimal text
    const char* seconds_per(time_precision unit);

    // per_second(unit), rounded half-up to working_precision digits
    const decimal& per_second_value(time_precision unit);

    // seconds_per(unit), exact. Every unit is a terminating decimal number
    // of seconds, so converting into seconds never needs a division.
    const decimal& seconds_per_value(time_precision unit);

    // Lowercase plural name ("milliseconds")
    const char* to_string(time_precision unit);

    // Resolves a plural or singular name, or one of s, ms, us, ns, fs, as
    boost::optional<time_precision> parse_time_precision(const std::string& name);
}

#endif // TIME_PRECISION_HPP
