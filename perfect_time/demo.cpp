//
// demo.cpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>
#include <boost/spirit/include/qi_char.hpp>
#include <boost/spirit/include/qi_eoi.hpp>
#include <boost/spirit/include/qi_lit.hpp>
#include <boost/spirit/include/qi_parse.hpp>
#include <boost/spirit/include/qi_plus.hpp>
#include <boost/spirit/include/qi_sequence.hpp>
#include <boost/spirit/include/qi_string.hpp>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "log.hpp"
#include "time_precision.hpp"
#include "timestamp.hpp"

namespace
{
    struct options
    {
        boost::optional<spdlog::level::level_enum> log_level;
        std::vector<std::string> positional;
    };

    int display_option_error(const char* const error, int argc, const char** argv)
    {
        if (argc == 0)
        {
            std::cerr << "Bad program" << std::endl;
        }
        else
        {
            std::cerr << error << "\n\n" <<
                argv[0] << " [--log-level=<level>] [<time> <unit> [<target unit>]]" << std::endl;
        }

        return EXIT_FAILURE;
    }

    // Returns false if an option is malformed
    bool read_options(int argc, const char** argv, options& read)
    {
        namespace qi = boost::spirit::qi;

        for (int index = 1; index < argc; ++index)
        {
            const char* const argument = argv[index];
            if (std::strncmp(argument, "--", 2) != 0)
            {
                read.positional.emplace_back(argument);
                continue;
            }

            std::string level_name;
            const char* first = argument;
            if (!qi::parse(
                    first,
                    argument + std::strlen(argument),
                    (qi::lit("--log-level=") >> +qi::char_ >> qi::eoi),
                    level_name))
            {
                return false;
            }

            read.log_level = perfect_time::log::parse_level(level_name);
            if (!read.log_level)
            {
                return false;
            }
        }

        return true;
    }

    // Run `step`, then print its result along with the time it took
    void benchmark(const char* const label, const std::function<std::string()>& step)
    {
        const boost::posix_time::ptime start =
            boost::posix_time::microsec_clock::universal_time();
        const std::string result = step();
        const boost::posix_time::time_duration elapsed =
            boost::posix_time::microsec_clock::universal_time() - start;

        std::cout << label << result << " (took " <<
            perfect_time::timestamp(
                elapsed.total_microseconds(),
                perfect_time::time_precision::microseconds) <<
            "s)" << std::endl;
    }

    void run_benchmark()
    {
        using perfect_time::time_precision;
        using perfect_time::timestamp;

        benchmark(
            "Current time to string: ",
            [] { return timestamp::current_time_to_string(); });
        benchmark(
            "          Current time: ",
            [] { return timestamp::now().value(); });
        benchmark(
            "             Zero time:          ",
            [] { return timestamp(0, time_precision::seconds).value(); });
        benchmark(
            "              One time:          ",
            [] { return timestamp(1, time_precision::seconds).value(); });
        benchmark(
            "     Negative One time:         ",
            [] { return timestamp(-1, time_precision::seconds).value(); });
        benchmark(
            "  Manual time (double): ",
            [] { return timestamp(-123456789.01234567, time_precision::seconds).value(); });
        benchmark(
            "  Manual time (string): ",
            []
            {
                return timestamp(
                    "-012345678911234567892123456789.012345678911234567892123456789",
                    time_precision::seconds).value();
            });
    }
}

int main(int argc, const char** argv)
{
    options read;
    if (!read_options(argc, argv, read))
    {
        return display_option_error("Invalid option provided", argc, argv);
    }

    if (read.log_level)
    {
        perfect_time::log::set_level(*read.log_level);
    }

    const std::size_t positional_count = read.positional.size();
    if (positional_count == 1 || 3 < positional_count)
    {
        return display_option_error("Zero, two or three arguments required", argc, argv);
    }

    boost::optional<perfect_time::time_precision> unit;
    boost::optional<perfect_time::time_precision> target_unit;
    if (2 <= positional_count)
    {
        unit = perfect_time::parse_time_precision(read.positional[1]);
        if (!unit)
        {
            return display_option_error("Unknown unit provided", argc, argv);
        }
    }
    if (positional_count == 3)
    {
        target_unit = perfect_time::parse_time_precision(read.positional[2]);
        if (!target_unit)
        {
            return display_option_error("Unknown target unit provided", argc, argv);
        }
    }

    try
    {
        if (!unit)
        {
            run_benchmark();
            return EXIT_SUCCESS;
        }

        const perfect_time::timestamp time(read.positional[0], *unit);
        perfect_time::log::get()->debug(
            "{} {} is {} seconds",
            read.positional[0],
            perfect_time::to_string(*unit),
            time.value());

        if (target_unit)
        {
            std::cout << time.as(*target_unit) << std::endl;
        }
        else
        {
            std::cout << time << std::endl;
        }
    }
    catch (const std::exception& error)
    {
        perfect_time::log::get()->error("{}", error.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
