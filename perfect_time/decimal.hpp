//
// decimal.hpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef DECIMAL_HPP
#define DECIMAL_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <stdexcept>
#include <string>
#include <utility>

#include "conversion.hpp"

namespace perfect_time
{
    // Thrown when text (or a non-finite number) is not a plain decimal
    class parse_error : public std::invalid_argument
    {
    public:

        explicit parse_error(const std::string& what) :
            std::invalid_argument(what)
        {
        }
    };

    // Exact base-10 fixed point value: unscaled * 10^-scale. Every
    // narrowing operation rounds half-up (ties away from zero).
    class decimal
    {
    public:

        using integer = boost::multiprecision::cpp_int;

        // Parse [+-]?(digits(.digits*)?|.digits). Throws parse_error.
        static decimal parse(const std::string& text);

        // Integers are exact, floating point goes through its shortest
        // round-trip decimal rendering. Throws parse_error if not finite.
        template<typename Number>
        static decimal from_number(const Number number)
        {
            return from_rendered(render_number(number));
        }

        // Zero with no fractional digits
        decimal() :
            unscaled_(0),
            scale_(0)
        {
        }

        decimal(integer unscaled, const unsigned scale) :
            unscaled_(std::move(unscaled)),
            scale_(scale)
        {
        }

        const integer& unscaled() const
        {
            return unscaled_;
        }

        unsigned scale() const
        {
            return scale_;
        }

        int signum() const
        {
            return unscaled_.sign();
        }

        // Same value with exactly new_scale fractional digits
        decimal rescale(unsigned new_scale) const;

        // this / divisor with result_scale fractional digits. Throws
        // std::domain_error when divisor is zero.
        decimal divide(const decimal& divisor, unsigned result_scale) const;

        // Exact product
        decimal multiply(const decimal& other) const;

        // Integer part, truncated toward zero
        integer integral_part() const;

        // -1, 0 or 1 depending on numeric order; scale is irrelevant
        int compare(const decimal& other) const;

        // Plain notation with exactly scale() fractional digits. Zero is
        // never signed.
        std::string to_string() const;

    private:

        // Accepts the plain grammar plus an optional e[+-]digits exponent
        static decimal from_rendered(const std::string& rendered);

        integer unscaled_;
        unsigned scale_;
    };

    inline bool operator==(const decimal& left, const decimal& right)
    {
        return left.compare(right) == 0;
    }

    inline bool operator!=(const decimal& left, const decimal& right)
    {
        return !(left == right);
    }

    inline bool operator<(const decimal& left, const decimal& right)
    {
        return left.compare(right) < 0;
    }
}

#endif // DECIMAL_HPP
