//
// conversion.hpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CONVERSION_HPP
#define CONVERSION_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <limits>
#include <string>
#include <type_traits>

namespace perfect_time
{
    // Decimal text of a host number. Floating point values produce the
    // shortest string that reads back to the same value, which may use
    // exponent notation ("1e+21") or be "inf"/"nan". Character types are
    // rendered as numbers.
    template<typename Number>
    inline std::string render_number(const Number number)
    {
        static_assert(
            std::is_arithmetic<Number>::value && !std::is_same<Number, bool>::value,
            "only numbers can be rendered");
        return fmt::format("{}", +number);
    }

    // Clamp an arbitrary precision integer into the range of Integer
    template<typename Integer>
    inline Integer saturate_cast(const boost::multiprecision::cpp_int& value)
    {
        static_assert(std::is_integral<Integer>::value, "integer type required");

        const boost::multiprecision::cpp_int lowest(std::numeric_limits<Integer>::min());
        const boost::multiprecision::cpp_int highest(std::numeric_limits<Integer>::max());

        if (value < lowest)
        {
            return std::numeric_limits<Integer>::min();
        }
        if (highest < value)
        {
            return std::numeric_limits<Integer>::max();
        }
        return value.convert_to<Integer>();
    }
}

#endif // CONVERSION_HPP
