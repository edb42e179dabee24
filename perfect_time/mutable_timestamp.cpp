//
// mutable_timestamp.cpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mutable_timestamp.hpp"

#include "log.hpp"

namespace perfect_time
{
    mutable_timestamp& mutable_timestamp::operator=(const mutable_timestamp& other)
    {
        if (this != &other)
        {
            set(other.get());
        }
        return *this;
    }

    timestamp mutable_timestamp::get() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    mutable_timestamp& mutable_timestamp::set(const timestamp& new_value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value_ = new_value;
        }
        log::get()->trace("mutable timestamp replaced with {}", new_value.value());
        return *this;
    }
}
