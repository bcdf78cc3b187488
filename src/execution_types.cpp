//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "execution_types.hpp"


namespace kiln
{
    auto to_string( execution_error const e )
        -> char const*
    {
        switch( e ) {
        case execution_error::validation_failed:
            return "validation_failed";
        case execution_error::unsupported_language:
            return "unsupported_language";
        case execution_error::engine_unavailable:
            return "engine_unavailable";
        case execution_error::rejected:
            return "rejected";
        case execution_error::timeout:
            return "timeout";
        case execution_error::stopped:
            return "stopped";
        case execution_error::stream_corrupted:
            return "stream_corrupted";
        case execution_error::execution_failed:
            return "execution_failed";
        }

        return "unknown";
    }

    auto to_string( container_status const s )
        -> char const*
    {
        switch( s ) {
        case container_status::creating:
            return "creating";
        case container_status::running:
            return "running";
        case container_status::stopped:
            return "stopped";
        case container_status::error:
            return "error";
        }

        return "unknown";
    }

    std::ostream& operator<<( std::ostream& os, execution_result const& res )
    {
        os << "id: " << res.id << std::endl
           << "exit_code: " << res.exit_code << std::endl
           << "duration_milli_sec: " << res.duration_milli_sec << std::endl
           << "timed_out: " << res.timed_out << std::endl
           << "error: " << ( res.error ? to_string( *res.error ) : "none" ) << std::endl
           << "stdout_bytes: " << res.stdout_text.size() << std::endl
           << "stderr_bytes: " << res.stderr_text.size() << std::endl
            ;

        return os;
    }

    std::ostream& operator<<( std::ostream& os, container_info const& info )
    {
        os << info.id
           << " (project: " << info.project_id
           << ", language: " << info.language
           << ", container: " << ( info.container_id.empty() ? "-" : info.container_id.substr( 0, 12 ) )
           << ", status: " << to_string( info.status )
           << ")";

        return os;
    }

} // namespace kiln
