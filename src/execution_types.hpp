//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <cstdint>
#include <iostream>
#include <map>
#include <string>

#include <boost/chrono/system_clocks.hpp>
#include <boost/optional.hpp>


namespace kiln
{
    using wall_clock = boost::chrono::system_clock;

    enum class execution_error
    {
        validation_failed,
        unsupported_language,
        engine_unavailable,
        rejected,               // admission control
        timeout,
        stopped,                // stop_container was called while running
        stream_corrupted,
        execution_failed,
    };

    auto to_string( execution_error const e )
        -> char const*;

    struct execution_request
    {
        std::string id;                 // generated when empty
        std::string project_id;
        std::string language;
        std::string code;               // empty: no main file is written
        boost::optional<std::string> command;
        std::map<std::string, std::string> environment;
        boost::optional<std::string> working_dir;
        std::map<std::string, std::string> files;   // relative path -> content
    };

    struct execution_result
    {
        std::string id;
        int exit_code;
        std::string stdout_text;
        std::string stderr_text;
        std::uint64_t duration_milli_sec;
        boost::optional<execution_error> error;
        bool timed_out;
    };

    enum class container_status
    {
        creating,
        running,
        stopped,
        error,
    };

    auto to_string( container_status const s )
        -> char const*;

    struct container_info
    {
        std::string id;                 // request id
        std::string project_id;
        std::string container_id;       // empty until the engine has created it
        std::string language;
        container_status status;
        wall_clock::time_point created_at;
        wall_clock::time_point last_activity;
    };

    enum class health_status
    {
        healthy,
        degraded,
    };

    struct health_report
    {
        health_status status;
        std::size_t active_containers;
        std::size_t supported_languages;
        bool engine_connected;
        boost::optional<std::string> error;
    };

    // printers
    std::ostream& operator<<( std::ostream& os, execution_result const& res );
    std::ostream& operator<<( std::ostream& os, container_info const& info );

} // namespace kiln
