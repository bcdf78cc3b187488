//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>


namespace kiln
{
    // "{workspace}" in environment values is replaced with the container workspace path
    struct language_config
    {
        std::string image;
        std::vector<std::string> command;       // the main file name is appended
        std::string file_extension;
        std::vector<std::string> setup;         // shell lines run after the project init, with network
        std::map<std::string, std::string> environment;
    };

    auto resolve_language( std::string const& language )
        -> boost::optional<language_config const&>;

    // in registration order
    auto language_names()
        -> std::vector<std::string>;

    auto main_file_name( language_config const& config )
        -> std::string;

    // maps the leading word of a raw shell line (interpreter, package tool, compiler)
    // to a language. unknown words fall back to "javascript"
    auto language_for_command( std::string const& command_line )
        -> std::string;

    // printer
    std::ostream& operator<<( std::ostream& os, language_config const& config );

} // namespace kiln
