//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "frame_decoder.hpp"

#include <algorithm>
#include <sstream>
#include <utility>


namespace kiln
{
    constexpr std::size_t frame_decoder::HeaderLength;
    constexpr std::uint32_t frame_decoder::MaxPayloadLength;

    frame_decoder::frame_decoder( sink_type sink )
        : sink_( std::move( sink ) )
        , state_( state::header )
        , header_{}
        , header_filled_( 0 )
        , current_kind_( stream_kind::stdout_stream )
        , payload_length_( 0 )
        , frames_decoded_( 0 )
    {}

    void frame_decoder::feed( char const* data, std::size_t size )
    {
        if ( state_ == state::failed ) {
            throw frame_error( "frame decoder is in failed state" );
        }

        while( size > 0 ) {
            if ( state_ == state::header ) {
                auto const n = std::min( size, HeaderLength - header_filled_ );
                std::copy( data, data + n, header_.begin() + header_filled_ );
                header_filled_ += n;
                data += n;
                size -= n;

                if ( header_filled_ == HeaderLength ) {
                    parse_header();
                }

            } else {
                auto const n = std::min<std::size_t>( size, payload_length_ - payload_.size() );
                payload_.append( data, n );
                data += n;
                size -= n;
            }

            if ( state_ == state::payload && payload_.size() == payload_length_ ) {
                ++frames_decoded_;
                // stdin frames are decoded but never reach the sink
                if ( payload_length_ > 0 && current_kind_ != stream_kind::stdin_stream ) {
                    sink_( current_kind_, payload_ );
                }

                payload_.clear();
                header_filled_ = 0;
                state_ = state::header;
            }
        }
    }

    void frame_decoder::parse_header()
    {
        auto const kind = header_[0];
        if ( kind > static_cast<std::uint8_t>( stream_kind::stderr_stream )
             || header_[1] != 0 || header_[2] != 0 || header_[3] != 0 ) {
            state_ = state::failed;

            std::stringstream ss;
            ss << "Invalid frame header: stream=" << static_cast<int>( kind )
               << " after " << frames_decoded_ << " frames";
            throw frame_error( ss.str() );
        }

        auto const length =
            ( static_cast<std::uint32_t>( header_[4] ) << 24 )
            | ( static_cast<std::uint32_t>( header_[5] ) << 16 )
            | ( static_cast<std::uint32_t>( header_[6] ) << 8 )
            | static_cast<std::uint32_t>( header_[7] )
            ;
        if ( length > MaxPayloadLength ) {
            state_ = state::failed;

            std::stringstream ss;
            ss << "Frame payload too large: " << length << " bytes";
            throw frame_error( ss.str() );
        }

        current_kind_ = static_cast<stream_kind>( kind );
        payload_length_ = length;
        payload_.reserve( length );
        state_ = state::payload;
    }

    auto frame_decoder::at_frame_boundary() const
        -> bool
    {
        return state_ == state::header && header_filled_ == 0;
    }

    auto frame_decoder::failed() const
        -> bool
    {
        return state_ == state::failed;
    }

    auto frame_decoder::frames_decoded() const
        -> std::size_t
    {
        return frames_decoded_;
    }

} // namespace kiln
