//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "language_registry.hpp"

#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem/path.hpp>


namespace kiln
{
    namespace
    {
        using language_table = std::vector<std::pair<std::string, language_config>>;

        // compiled languages build into /tmp so that the workspace stays clean,
        // the main file is passed as $0
        auto const& languages()
        {
            static language_table const table = {
                { "javascript", {
                        "node:18-alpine",
                        { "node" },
                        ".js",
                        { "npm install" },
                        {}
                    } },
                { "typescript", {
                        "node:18-alpine",
                        { "npx", "--no-install", "tsx" },
                        ".ts",
                        { "npm install --save-dev tsx" },
                        {}
                    } },
                { "python", {
                        "python:3.11-alpine",
                        { "python", "-u" },
                        ".py",
                        {},
                        {
                            { "PYTHONUSERBASE", "{workspace}/.python" },
                            { "PYTHONDONTWRITEBYTECODE", "1" },
                        }
                    } },
                { "java", {
                        "eclipse-temurin:17-jdk-alpine",
                        { "java" },
                        ".java",
                        {},
                        {}
                    } },
                { "go", {
                        "golang:1.21-alpine",
                        { "go", "run" },
                        ".go",
                        {},
                        {
                            { "GOPATH", "{workspace}/.go" },
                            { "GOCACHE", "/tmp/go-build" },
                        }
                    } },
                { "rust", {
                        "rust:1-alpine",
                        { "sh", "-c", "rustc -O -o /tmp/main \"$0\" && exec /tmp/main" },
                        ".rs",
                        {},
                        {}
                    } },
                { "c", {
                        "gcc:13",
                        { "sh", "-c", "gcc -O2 -o /tmp/main \"$0\" && exec /tmp/main" },
                        ".c",
                        {},
                        {}
                    } },
                { "cpp", {
                        "gcc:13",
                        { "sh", "-c", "g++ -O2 -std=c++17 -o /tmp/main \"$0\" && exec /tmp/main" },
                        ".cpp",
                        {},
                        {}
                    } },
            };

            return table;
        }

        auto const& command_languages()
        {
            static std::map<std::string, std::string> const table = {
                { "node", "javascript" },
                { "npm", "javascript" },
                { "npx", "javascript" },
                { "yarn", "javascript" },
                { "tsx", "typescript" },
                { "tsc", "typescript" },
                { "python", "python" },
                { "python3", "python" },
                { "pip", "python" },
                { "pip3", "python" },
                { "java", "java" },
                { "javac", "java" },
                { "mvn", "java" },
                { "go", "go" },
                { "cargo", "rust" },
                { "rustc", "rust" },
                { "gcc", "c" },
                { "cc", "c" },
                { "make", "c" },
                { "g++", "cpp" },
                { "c++", "cpp" },
            };

            return table;
        }
    }

    auto resolve_language( std::string const& language )
        -> boost::optional<language_config const&>
    {
        for( auto const& row : languages() ) {
            if ( row.first == language ) {
                return row.second;
            }
        }

        return boost::none;
    }

    auto language_names()
        -> std::vector<std::string>
    {
        std::vector<std::string> names;
        for( auto const& row : languages() ) {
            names.push_back( row.first );
        }

        return names;
    }

    auto main_file_name( language_config const& config )
        -> std::string
    {
        return "main" + config.file_extension;
    }

    auto language_for_command( std::string const& command_line )
        -> std::string
    {
        auto const trimmed = boost::trim_copy( command_line );
        auto const end = trimmed.find_first_of( " \t" );
        auto const first_word = trimmed.substr( 0, end );

        // "/usr/bin/python3" -> "python3"
        auto const program = boost::filesystem::path( first_word ).filename().string();

        auto const& table = command_languages();
        auto const it = table.find( program );
        if ( it == table.cend() ) {
            return "javascript";
        }

        return it->second;
    }

    std::ostream& operator<<( std::ostream& os, language_config const& config )
    {
        os << "language_config" << std::endl
           << "  image    : " << config.image << std::endl
           << "  command  : " << boost::algorithm::join( config.command, " " ) << std::endl
           << "  extension: " << config.file_extension << std::endl
            ;

        os << "  setup: " << std::endl;
        for( auto&& s : config.setup ) {
            os << "    " << s << std::endl;
        }

        os << "  envs: " << std::endl;
        for( auto&& env : config.environment ) {
            os << "    " << env.first << "=" << env.second << std::endl;
        }

        return os;
    }

} // namespace kiln
