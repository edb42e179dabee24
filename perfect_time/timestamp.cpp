//
// timestamp.cpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "timestamp.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/spirit/include/qi_alternative.hpp>
#include <boost/spirit/include/qi_char.hpp>
#include <boost/spirit/include/qi_char_class.hpp>
#include <boost/spirit/include/qi_eoi.hpp>
#include <boost/spirit/include/qi_kleene.hpp>
#include <boost/spirit/include/qi_lit.hpp>
#include <boost/spirit/include/qi_optional.hpp>
#include <boost/spirit/include/qi_parse.hpp>
#include <boost/spirit/include/qi_plus.hpp>
#include <boost/spirit/include/qi_real.hpp>
#include <boost/spirit/include/qi_repeat.hpp>
#include <boost/spirit/include/qi_sequence.hpp>
#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>

#include "conversion.hpp"
#include "log.hpp"

namespace perfect_time
{
    const unsigned timestamp::fractional_digits;

    namespace
    {
        const boost::posix_time::ptime unix_epoch(boost::gregorian::date(1970, 1, 1));

        // Bounds of boost::gregorian::date, as milliseconds from unix_epoch
        decimal::integer earliest_ptime_milliseconds()
        {
            const boost::posix_time::ptime earliest(boost::gregorian::date(1400, 1, 1));
            return decimal::integer((earliest - unix_epoch).total_milliseconds());
        }

        decimal::integer latest_ptime_milliseconds()
        {
            const boost::posix_time::ptime latest(
                boost::gregorian::date(9999, 12, 31),
                boost::posix_time::hours(24) - boost::posix_time::milliseconds(1));
            return decimal::integer((latest - unix_epoch).total_milliseconds());
        }
    }

    timestamp timestamp::now()
    {
        const boost::posix_time::time_duration since_epoch =
            boost::posix_time::microsec_clock::universal_time() - unix_epoch;
        return timestamp(since_epoch.total_milliseconds(), time_precision::milliseconds);
    }

    std::string timestamp::current_time_to_string()
    {
        return now().value();
    }

    bool timestamp::is_canonical(const std::string& text)
    {
        namespace qi = boost::spirit::qi;

        std::string::const_iterator first = text.begin();
        const bool matches = qi::parse(
            first,
            text.end(),
            (
                -qi::lit('-') >>
                (qi::lit('0') | (qi::char_('1', '9') >> *qi::digit)) >>
                qi::lit('.') >>
                qi::repeat(fractional_digits)[qi::digit] >>
                qi::eoi));

        // zero is never negative
        return matches &&
            !(text[0] == '-' && text.find_first_not_of("-0.") == std::string::npos);
    }

    timestamp::timestamp() :
        value_(decimal(0, fractional_digits).to_string())
    {
    }

    timestamp::timestamp(const std::string& time, const time_precision unit) :
        timestamp(decimal::parse(time), unit)
    {
    }

    timestamp::timestamp(const decimal& time, const time_precision unit) :
        value_()
    {
        if (working_precision < time.scale())
        {
            log::get()->debug(
                "{} has {} fractional digits, rounding half-up to {}",
                time.to_string(),
                time.scale(),
                working_precision);
        }

        const decimal seconds = time
            .rescale(working_precision)
            .multiply(seconds_per_value(unit))
            .rescale(working_precision);
        value_ = seconds.rescale(fractional_digits).to_string();
    }

    std::string timestamp::as(const time_precision unit) const
    {
        return decimal::parse(value_)
            .multiply(per_second_value(unit))
            .rescale(fractional_digits)
            .to_string();
    }

    std::int32_t timestamp::to_int() const
    {
        return saturate_cast<std::int32_t>(decimal::parse(value_).integral_part());
    }

    std::int64_t timestamp::to_long() const
    {
        return saturate_cast<std::int64_t>(decimal::parse(value_).integral_part());
    }

    float timestamp::to_float() const
    {
        const double value = to_double();
        if (std::numeric_limits<float>::max() < std::abs(value))
        {
            return value < 0 ?
                -std::numeric_limits<float>::infinity() :
                std::numeric_limits<float>::infinity();
        }
        return static_cast<float>(value);
    }

    double timestamp::to_double() const
    {
        namespace qi = boost::spirit::qi;

        // trailing zeroes only lengthen the mantissa
        std::string text = value_;
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.')
        {
            text.pop_back();
        }

        double result = 0;
        std::string::const_iterator first = text.begin();
        if (!qi::parse(first, text.cend(), (qi::double_ >> qi::eoi), result))
        {
            // beyond the range of double
            return text[0] == '-' ?
                -std::numeric_limits<double>::infinity() :
                std::numeric_limits<double>::infinity();
        }
        return result;
    }

    boost::posix_time::ptime timestamp::to_ptime() const
    {
        const decimal::integer milliseconds =
            decimal::parse(as(time_precision::milliseconds)).integral_part();
        if (milliseconds < earliest_ptime_milliseconds() ||
            latest_ptime_milliseconds() < milliseconds)
        {
            throw std::out_of_range(
                value_ + " seconds is outside the range of boost::posix_time::ptime");
        }
        return unix_epoch +
            boost::posix_time::milliseconds(static_cast<std::int64_t>(milliseconds));
    }

    bool operator==(const timestamp& left, const timestamp& right)
    {
        return left.value() == right.value();
    }

    bool operator<(const timestamp& left, const timestamp& right)
    {
        return decimal::parse(left.value()) < decimal::parse(right.value());
    }

    std::ostream& operator<<(std::ostream& out, const timestamp& time)
    {
        return out << time.value();
    }
}
