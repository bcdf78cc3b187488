//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>


namespace kiln
{
    enum class stream_kind : std::uint8_t
    {
        stdin_stream = 0,
        stdout_stream = 1,
        stderr_stream = 2,
    };

    class frame_error
        : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    //
    // Incremental decoder for the multiplexed attach stream of the engine.
    //
    // Every frame is an 8 bytes header followed by a payload:
    //   [0]    stream kind (0: stdin, 1: stdout, 2: stderr)
    //   [1..3] zero
    //   [4..7] payload length, big endian
    //
    // Bytes may arrive split at any position. Incomplete headers and payloads
    // are carried over to the next feed() and only complete stdout/stderr frames
    // reach the sink.
    //
    class frame_decoder
    {
    public:
        static constexpr std::size_t HeaderLength = 8;
        static constexpr std::uint32_t MaxPayloadLength = 16 * 1024 * 1024;

        using sink_type = std::function<void (stream_kind, std::string const&)>;

        explicit frame_decoder( sink_type sink );

        // throws frame_error on a malformed header. the decoder stays failed afterwards
        void feed( char const* data, std::size_t size );

        // true when no partial frame is pending
        auto at_frame_boundary() const
            -> bool;

        auto failed() const
            -> bool;

        auto frames_decoded() const
            -> std::size_t;

    private:
        enum class state
        {
            header,
            payload,
            failed,
        };

        void parse_header();

        sink_type sink_;

        state state_;
        std::array<std::uint8_t, HeaderLength> header_;
        std::size_t header_filled_;

        stream_kind current_kind_;
        std::uint32_t payload_length_;
        std::string payload_;

        std::size_t frames_decoded_;
    };

} // namespace kiln
