//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "admission_gate.hpp"

#include <stdexcept>

#include <boost/thread/locks.hpp>


namespace kiln
{
    admission_gate::admission_gate( std::size_t const capacity )
        : capacity_( capacity )
        , in_use_( 0 )
    {
        if ( capacity_ == 0 ) {
            throw std::invalid_argument( "admission gate capacity must be >= 1" );
        }
    }

    auto admission_gate::try_acquire_for( boost::chrono::milliseconds const timeout )
        -> bool
    {
        boost::unique_lock<boost::mutex> lock( mutex_ );

        auto const has_room = [this] { return in_use_ < capacity_; };
        if ( !released_.wait_for( lock, timeout, has_room ) ) {
            return false;
        }

        ++in_use_;
        return true;
    }

    void admission_gate::release() noexcept
    {
        {
            boost::lock_guard<boost::mutex> lock( mutex_ );
            if ( in_use_ > 0 ) {
                --in_use_;
            }
        }
        released_.notify_one();
    }

    auto admission_gate::capacity() const
        -> std::size_t
    {
        return capacity_;
    }

    auto admission_gate::in_use() const
        -> std::size_t
    {
        boost::lock_guard<boost::mutex> lock( mutex_ );
        return in_use_;
    }


    admission_slot::admission_slot( admission_gate& gate, boost::chrono::milliseconds const timeout )
        : gate_( gate )
        , acquired_( gate.try_acquire_for( timeout ) )
    {}

    admission_slot::~admission_slot()
    {
        if ( acquired_ ) {
            gate_.release();
        }
    }

} // namespace kiln
