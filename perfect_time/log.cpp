//
// log.cpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace perfect_time
{
    namespace log
    {
        namespace
        {
            std::shared_ptr<spdlog::logger> make_logger()
            {
                // not registered with spdlog, so host applications keep
                // control of the global registry
                auto logger = std::make_shared<spdlog::logger>(
                    "perfect_time",
                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
                logger->set_level(spdlog::level::info);
                return logger;
            }
        }

        std::shared_ptr<spdlog::logger> get()
        {
            static const std::shared_ptr<spdlog::logger> logger = make_logger();
            return logger;
        }

        void set_level(const spdlog::level::level_enum level)
        {
            get()->set_level(level);
        }

        boost::optional<spdlog::level::level_enum> parse_level(const std::string& name)
        {
            // from_str maps unknown names to off
            const spdlog::level::level_enum level = spdlog::level::from_str(name);
            if (level == spdlog::level::off && name != "off")
            {
                return boost::none;
            }
            return level;
        }
    }
}
