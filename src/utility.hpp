//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <string>
#include <vector>
#include <sstream>


namespace kiln
{
    enum class severity
    {
        info,
        warn,
        error,
    };

    // writes a whole line to std::clog when destructed, so lines from
    // concurrent executions are never interleaved
    class log_line
    {
    public:
        explicit log_line( severity level );
        log_line( log_line const& ) = delete;
        ~log_line();

        template<typename T>
        auto operator<<( T const& value )
            -> log_line&
        {
            ss_ << value;
            return *this;
        }

    private:
        severity level_;
        std::stringstream ss_;
    };


    auto make_random_name( std::size_t length )
        -> std::string;

    auto make_execution_id()
        -> std::string;

    // splits a command line into words like a POSIX shell does
    // (quotes and backslashes are honored, operators are not recognized).
    // throws std::runtime_error on an unterminated quote
    auto split_command_line( std::string const& line )
        -> std::vector<std::string>;

    // wraps the value in single quotes so that a POSIX shell reads it back verbatim
    auto shell_quote( std::string const& value )
        -> std::string;

} // namespace kiln
