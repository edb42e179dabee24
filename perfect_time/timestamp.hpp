//
// timestamp.hpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TIMESTAMP_HPP
#define TIMESTAMP_HPP

#include <boost/date_time/posix_time/ptime.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <type_traits>

#include "decimal.hpp"
#include "time_precision.hpp"

namespace perfect_time
{
    // An instant as seconds since the Unix epoch, stored as text in the
    // form -?[0-9]+\.[0-9]{18}. Instances never change after construction.
    class timestamp
    {
    public:

        // Digits after the radix point of every value (attoseconds)
        static const unsigned fractional_digits = 18;

        // Current wall clock time, at millisecond granularity
        static timestamp now();

        static std::string current_time_to_string();

        // True if text is exactly what construction would produce for it:
        // no sign on zero, no leading zeroes, 18 fractional digits.
        static bool is_canonical(const std::string& text);

        // The epoch, 0.000000000000000000
        timestamp();

        // `time` is counted in `unit`. Floating point values are taken at
        // their shortest decimal rendering, so 0.1 means exactly 0.1.
        // Throws parse_error if time is not finite.
        template<
            typename Number,
            typename = typename std::enable_if<
                std::is_arithmetic<Number>::value &&
                !std::is_same<Number, bool>::value>::type>
        timestamp(const Number time, const time_precision unit) :
            timestamp(decimal::from_number(time), unit)
        {
        }

        // `time` is a plain decimal counted in `unit`. Throws parse_error.
        timestamp(const std::string& time, time_precision unit);

        // The canonical string
        const std::string& value() const
        {
            return value_;
        }

        const std::string& to_string() const
        {
            return value_;
        }

        // This instant counted in unit, rounded half-up to 18 fractional
        // digits. Coarse units therefore lose resolution: as(days) keeps
        // 1e-18 days, not 1e-18 seconds.
        std::string as(time_precision unit) const;

        // Lossy conversions for systems that cannot take the string. The
        // integer forms drop the fraction and saturate at their range.
        // The floating forms round to nearest regardless of the C locale and
        // become infinite past their range.
        std::int32_t to_int() const;
        std::int64_t to_long() const;
        float to_float() const;
        double to_double() const;

        // Truncated to whole milliseconds. Throws std::out_of_range outside
        // 1400-01-01 to 9999-12-31, the range of boost::gregorian::date.
        boost::posix_time::ptime to_ptime() const;

    private:

        timestamp(const decimal& time, time_precision unit);

        std::string value_;
    };

    bool operator==(const timestamp& left, const timestamp& right);
    bool operator<(const timestamp& left, const timestamp& right);

    inline bool operator!=(const timestamp& left, const timestamp& right)
    {
        return !(left == right);
    }

    inline bool operator>(const timestamp& left, const timestamp& right)
    {
        return right < left;
    }

    inline bool operator<=(const timestamp& left, const timestamp& right)
    {
        return !(right < left);
    }

    inline bool operator>=(const timestamp& left, const timestamp& right)
    {
        return !(left < right);
    }

    std::ostream& operator<<(std::ostream& out, const timestamp& time);
}

#endif // TIMESTAMP_HPP
