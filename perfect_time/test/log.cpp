#include <boost/test/minimal.hpp>

#include "log.hpp"

int test_main(int, char**)
{
    {
        BOOST_CHECK(perfect_time::log::get() != nullptr);
        BOOST_CHECK(perfect_time::log::get() == perfect_time::log::get());
        BOOST_CHECK(perfect_time::log::get()->name() == "perfect_time");
        BOOST_CHECK(perfect_time::log::get()->level() == spdlog::level::info);
    }
    {
        BOOST_CHECK(perfect_time::log::parse_level("trace") == spdlog::level::trace);
        BOOST_CHECK(perfect_time::log::parse_level("debug") == spdlog::level::debug);
        BOOST_CHECK(perfect_time::log::parse_level("error") == spdlog::level::err);
        BOOST_CHECK(perfect_time::log::parse_level("off") == spdlog::level::off);
        BOOST_CHECK(!perfect_time::log::parse_level("loud"));
        BOOST_CHECK(!perfect_time::log::parse_level(""));
    }
    {
        perfect_time::log::set_level(spdlog::level::debug);
        BOOST_CHECK(perfect_time::log::get()->level() == spdlog::level::debug);
        BOOST_CHECK(perfect_time::log::get()->should_log(spdlog::level::debug));
        BOOST_CHECK(!perfect_time::log::get()->should_log(spdlog::level::trace));

        perfect_time::log::set_level(spdlog::level::off);
        BOOST_CHECK(!perfect_time::log::get()->should_log(spdlog::level::critical));
    }
    return 0;
}
