//
// decimal.cpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "decimal.hpp"

#include <algorithm>
#include <boost/spirit/include/qi_alternative.hpp>
#include <boost/spirit/include/qi_char.hpp>
#include <boost/spirit/include/qi_char_class.hpp>
#include <boost/spirit/include/qi_eoi.hpp>
#include <boost/spirit/include/qi_int.hpp>
#include <boost/spirit/include/qi_kleene.hpp>
#include <boost/spirit/include/qi_lit.hpp>
#include <boost/spirit/include/qi_optional.hpp>
#include <boost/spirit/include/qi_parse.hpp>
#include <boost/spirit/include/qi_plus.hpp>
#include <boost/spirit/include/qi_sequence.hpp>

namespace perfect_time
{
    namespace
    {
        decimal::integer power_of_ten(const unsigned exponent)
        {
            return boost::multiprecision::pow(decimal::integer(10), exponent);
        }

        // numerator / denominator, ties rounded away from zero
        decimal::integer divide_half_up(
            const decimal::integer& numerator,
            const decimal::integer& denominator)
        {
            decimal::integer quotient;
            decimal::integer remainder;
            boost::multiprecision::divide_qr(numerator, denominator, quotient, remainder);

            const decimal::integer twice_remainder = boost::multiprecision::abs(remainder) * 2;
            if (boost::multiprecision::abs(denominator) <= twice_remainder)
            {
                quotient += numerator.sign() * denominator.sign();
            }
            return quotient;
        }

        // A digit string without sign. Leading zeroes would otherwise be
        // read as an octal prefix.
        decimal::integer digits_to_integer(const std::string& digits)
        {
            const std::size_t significant = digits.find_first_not_of('0');
            if (significant == std::string::npos)
            {
                return decimal::integer(0);
            }
            return decimal::integer(digits.c_str() + significant);
        }

        bool is_plain_decimal(const std::string& text)
        {
            namespace qi = boost::spirit::qi;

            std::string::const_iterator first = text.begin();
            return qi::parse(
                first,
                text.end(),
                (
                    -(qi::lit('+') | qi::lit('-')) >>
                    (
                        (+qi::digit >> -(qi::lit('.') >> *qi::digit)) |
                        (qi::lit('.') >> +qi::digit)) >>
                    qi::eoi));
        }
    }

    decimal decimal::parse(const std::string& text)
    {
        if (!is_plain_decimal(text))
        {
            throw parse_error("not a plain decimal number: \"" + text + "\"");
        }

        std::string::const_iterator digits_begin = text.begin();
        const bool negative = (*digits_begin == '-');
        if (negative || *digits_begin == '+')
        {
            ++digits_begin;
        }

        const std::string::const_iterator radix = std::find(digits_begin, text.end(), '.');
        std::string digits(digits_begin, radix);
        unsigned scale = 0;
        if (radix != text.end())
        {
            digits.append(radix + 1, text.end());
            scale = unsigned(text.end() - (radix + 1));
        }

        integer unscaled = digits_to_integer(digits);
        if (negative)
        {
            unscaled = -unscaled;
        }
        return decimal(std::move(unscaled), scale);
    }

    decimal decimal::from_rendered(const std::string& rendered)
    {
        const std::size_t exponent_marker = rendered.find_first_of("eE");
        if (exponent_marker == std::string::npos)
        {
            return parse(rendered);
        }

        namespace qi = boost::spirit::qi;

        int exponent = 0;
        std::string::const_iterator first = rendered.begin() + exponent_marker + 1;
        if (!qi::parse(first, rendered.end(), (qi::int_ >> qi::eoi), exponent))
        {
            throw parse_error("not a decimal number: \"" + rendered + "\"");
        }

        const decimal mantissa = parse(rendered.substr(0, exponent_marker));
        if (exponent < 0)
        {
            return decimal(mantissa.unscaled_, mantissa.scale_ + unsigned(-exponent));
        }
        if (unsigned(exponent) <= mantissa.scale_)
        {
            return decimal(mantissa.unscaled_, mantissa.scale_ - unsigned(exponent));
        }
        return decimal(
            mantissa.unscaled_ * power_of_ten(unsigned(exponent) - mantissa.scale_), 0);
    }

    decimal decimal::rescale(const unsigned new_scale) const
    {
        if (scale_ <= new_scale)
        {
            return decimal(unscaled_ * power_of_ten(new_scale - scale_), new_scale);
        }
        return decimal(divide_half_up(unscaled_, power_of_ten(scale_ - new_scale)), new_scale);
    }

    decimal decimal::divide(const decimal& divisor, const unsigned result_scale) const
    {
        if (divisor.signum() == 0)
        {
            throw std::domain_error("decimal division by zero");
        }

        const integer numerator = unscaled_ * power_of_ten(result_scale + divisor.scale_);
        const integer denominator = divisor.unscaled_ * power_of_ten(scale_);
        return decimal(divide_half_up(numerator, denominator), result_scale);
    }

    decimal decimal::multiply(const decimal& other) const
    {
        return decimal(unscaled_ * other.unscaled_, scale_ + other.scale_);
    }

    decimal::integer decimal::integral_part() const
    {
        return integer(unscaled_ / power_of_ten(scale_));
    }

    int decimal::compare(const decimal& other) const
    {
        const unsigned common_scale = std::max(scale_, other.scale_);
        const integer left = unscaled_ * power_of_ten(common_scale - scale_);
        const integer right = other.unscaled_ * power_of_ten(common_scale - other.scale_);
        const int order = left.compare(right);
        return order < 0 ? -1 : (0 < order ? 1 : 0);
    }

    std::string decimal::to_string() const
    {
        const integer magnitude = boost::multiprecision::abs(unscaled_);
        std::string text = magnitude.str();

        if (text.size() <= scale_)
        {
            text.insert(0, scale_ + 1 - text.size(), '0');
        }
        if (scale_ != 0)
        {
            text.insert(text.size() - scale_, 1, '.');
        }
        if (unscaled_.sign() < 0)
        {
            text.insert(0, 1, '-');
        }
        return text;
    }
}
