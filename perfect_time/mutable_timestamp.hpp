//
// mutable_timestamp.hpp
// ~~~~~~~~~~~~~
//
// Copyright (c) 2026 The perfect_time authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying)
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MUTABLE_TIMESTAMP_HPP
#define MUTABLE_TIMESTAMP_HPP

#include <mutex>
#include <string>

#include "timestamp.hpp"

namespace perfect_time
{
    // Holds one timestamp that can be replaced as a whole. Replacement and
    // reads are serialized, so a reader never sees a partial value.
    class mutable_timestamp
    {
    public:

        mutable_timestamp() :
            mutex_(),
            value_()
        {
        }

        explicit mutable_timestamp(const timestamp& basis) :
            mutex_(),
            value_(basis)
        {
        }

        template<typename Time>
        mutable_timestamp(const Time& time, const time_precision unit) :
            mutex_(),
            value_(time, unit)
        {
        }

        mutable_timestamp(const mutable_timestamp& other) :
            mutex_(),
            value_(other.get())
        {
        }

        mutable_timestamp& operator=(const mutable_timestamp& other);

        // Copy of the held value
        timestamp get() const;

        // Construct a new value and replace the held one. The held value is
        // unchanged if construction throws.
        template<typename Time>
        mutable_timestamp& set_value(const Time& new_value, const time_precision unit)
        {
            return set(timestamp(new_value, unit));
        }

        mutable_timestamp& set(const timestamp& new_value);

    private:

        mutable std::mutex mutex_;
        timestamp value_;
    };
}

#endif // MUTABLE_TIMESTAMP_HPP
