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
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "execution_runtime.hpp"
#include "execution_types.hpp"


namespace kiln
{
    enum class package_list_format
    {
        json_dependency_map,    // { "dependencies": { "<name>": ... } }
        json_package_array,     // [ { "name": "<name>", ... } ]
        line_first_token,
    };

    //
    // Shell lines run inside the project workspace.
    // "{packages}" is replaced by the quoted specifiers, "{project}" by the quoted project id
    //
    struct package_operations
    {
        std::string package_file;

        std::string init_command;
        std::string install_command;
        std::string remove_command;
        std::string remove_suffix;      // appended to every specifier of remove
        std::string list_command;

        package_list_format list_format;
        std::size_t skip_lines;
        std::vector<std::string> ignored_prefixes;
    };

    auto resolve_package_operations( std::string const& language )
        -> boost::optional<package_operations const&>;

    auto package_languages()
        -> std::vector<std::string>;

    auto is_valid_package_specifier( std::string const& specifier )
        -> bool;

    // boost::none if the output does not have the expected shape
    auto parse_package_list( package_operations const& ops, std::string const& output )
        -> boost::optional<std::vector<std::string>>;


    struct package_install_request
    {
        std::string project_id;
        std::string language;
        std::vector<std::string> packages;
        boost::optional<std::string> working_dir;
    };

    struct package_install_result
    {
        bool success;
        std::string stdout_text;
        std::string stderr_text;
        std::uint64_t duration_milli_sec;
        std::vector<std::string> installed_packages;    // empty on failure
        boost::optional<execution_error> error;
        std::string message;
    };

    enum class package_list_status
    {
        ok,
        unparseable,
        execution_failed,
        unsupported_language,
    };

    auto to_string( package_list_status const status )
        -> char const*;

    struct package_list_result
    {
        package_list_status status;
        std::vector<std::string> packages;
        std::string raw_output;
    };

    std::ostream& operator<<( std::ostream& os, package_install_result const& result );


    //
    // Package operations run as ordinary executions in the project workspace,
    // so installed packages persist between the containers of one project.
    //
    class package_manager
    {
    public:
        explicit package_manager( execution_runtime& runtime );

        auto install_packages( package_install_request const& request )
            -> package_install_result;

        auto initialize_project( std::string const& project_id, std::string const& language )
            -> package_install_result;

        auto get_installed_packages( std::string const& project_id, std::string const& language )
            -> package_list_result;

        // empty on any failure
        auto installed_package_names( std::string const& project_id, std::string const& language )
            -> std::vector<std::string>;

        auto remove_packages(
            std::string const& project_id,
            std::string const& language,
            std::vector<std::string> const& packages
            )
            -> package_install_result;

        auto get_supported_languages() const
            -> std::vector<std::string>;

        auto get_package_file( std::string const& language ) const
            -> boost::optional<std::string>;

    private:
        auto run_operation(
            std::string const& project_id,
            std::string const& language,
            std::string const& line,
            boost::optional<std::string> const& working_dir
            )
            -> execution_result;

        auto modify_packages(
            std::string const& project_id,
            std::string const& language,
            std::vector<std::string> const& packages,
            boost::optional<std::string> const& working_dir,
            bool const is_install
            )
            -> package_install_result;

        execution_runtime& runtime_;
    };

} // namespace kiln
