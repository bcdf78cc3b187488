//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <cstddef>

#include <boost/chrono/duration.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>


namespace kiln
{
    // counting gate that bounds the number of containers alive at the same time
    class admission_gate
    {
    public:
        // throws std::invalid_argument if capacity is 0
        explicit admission_gate( std::size_t const capacity );

        admission_gate( admission_gate const& ) = delete;
        admission_gate& operator=( admission_gate const& ) = delete;

        // waits at most `timeout` for a free slot
        auto try_acquire_for( boost::chrono::milliseconds const timeout )
            -> bool;

        void release() noexcept;

        auto capacity() const
            -> std::size_t;

        auto in_use() const
            -> std::size_t;

    private:
        mutable boost::mutex mutex_;
        boost::condition_variable released_;

        std::size_t const capacity_;
        std::size_t in_use_;
    };

    class admission_slot
    {
    public:
        admission_slot( admission_gate& gate, boost::chrono::milliseconds const timeout );
        ~admission_slot();

        admission_slot( admission_slot const& ) = delete;
        admission_slot& operator=( admission_slot const& ) = delete;

        explicit operator bool() const
        {
            return acquired_;
        }

    private:
        admission_gate& gate_;
        bool acquired_;
    };

} // namespace kiln
