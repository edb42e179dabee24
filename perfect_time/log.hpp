//
// log.hpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOG_HPP
#define LOG_HPP

#include <boost/optional.hpp>
#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace perfect_time
{
    namespace log
    {
        // Logger used by every perfect_time component (stderr, "perfect_time")
        std::shared_ptr<spdlog::logger> get();

        void set_level(spdlog::level::level_enum level);

        // "trace", "debug", "info", "warning", "error", "critical" or "off"
        boost::optional<spdlog::level::level_enum> parse_level(const std::string& name);
    }
}

#endif // LOG_HPP
