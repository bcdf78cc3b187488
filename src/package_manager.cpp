//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "package_manager.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include <boost/algorithm/string.hpp>

#include <picojson.h>

#include "language_registry.hpp"
#include "utility.hpp"


namespace kiln
{
    namespace
    {
        using operations_table = std::vector<std::pair<std::string, package_operations>>;

        auto const& operations()
        {
            static package_operations const npm = {
                "package.json",
                "npm init -y",
                "npm install --save {packages}",
                "npm uninstall --save {packages}",
                "",
                "npm ls --depth=0 --json",
                package_list_format::json_dependency_map,
                0,
                {}
            };

            static operations_table const table = {
                { "javascript", npm },
                { "typescript", npm },
                { "python", {
                        "requirements.txt",
                        "touch requirements.txt",
                        "pip install --user {packages} && pip freeze --user > requirements.txt",
                        "pip uninstall -y {packages} && pip freeze --user > requirements.txt",
                        "",
                        "pip list --user --format=json",
                        package_list_format::json_package_array,
                        0,
                        {}
                    } },
                { "go", {
                        "go.mod",
                        "go mod init {project}",
                        "go get {packages}",
                        "go get {packages}",
                        "@none",
                        "go list -m all",
                        package_list_format::line_first_token,
                        1,                  // the main module
                        { "go:" }
                    } },
                { "rust", {
                        "Cargo.toml",
                        "cargo init --name app .",
                        "cargo add {packages}",
                        "cargo remove {packages}",
                        "",
                        "cargo tree --depth 1 --prefix none -e normal",
                        package_list_format::line_first_token,
                        1,                  // the crate itself
                        {}
                    } },
            };

            return table;
        }

        auto quote_packages( std::vector<std::string> const& packages, std::string const& suffix )
            -> std::string
        {
            std::vector<std::string> quoted;
            for( auto const& p : packages ) {
                quoted.push_back( shell_quote( p + suffix ) );
            }

            return boost::algorithm::join( quoted, " " );
        }

        auto parse_dependency_map( std::string const& output )
            -> boost::optional<std::vector<std::string>>
        {
            picojson::value v;
            auto const err = picojson::parse( v, output );
            if ( !err.empty() || !v.is<picojson::object>() ) {
                return boost::none;
            }

            std::vector<std::string> names;

            auto const& root = v.get<picojson::object>();
            auto const it = root.find( "dependencies" );
            if ( it == root.cend() ) {
                // a fresh project without dependencies
                return names;
            }
            if ( !it->second.is<picojson::object>() ) {
                return boost::none;
            }

            for( auto const& dep : it->second.get<picojson::object>() ) {
                names.push_back( dep.first );
            }

            return names;
        }

        auto parse_package_array( std::string const& output )
            -> boost::optional<std::vector<std::string>>
        {
            picojson::value v;
            auto const err = picojson::parse( v, output );
            if ( !err.empty() || !v.is<picojson::array>() ) {
                return boost::none;
            }

            std::vector<std::string> names;
            for( auto const& record : v.get<picojson::array>() ) {
                if ( !record.is<picojson::object>() ) {
                    return boost::none;
                }

                auto const& obj = record.get<picojson::object>();
                auto const it = obj.find( "name" );
                if ( it == obj.cend() || !it->second.is<std::string>() ) {
                    return boost::none;
                }

                names.push_back( it->second.get<std::string>() );
            }

            return names;
        }

        auto parse_lines( package_operations const& ops, std::string const& output )
            -> std::vector<std::string>
        {
            std::vector<std::string> lines;
            boost::algorithm::split( lines, output, boost::is_any_of( "\n" ) );

            std::vector<std::string> names;
            std::size_t skipped = 0;
            for( auto const& raw : lines ) {
                auto const line = boost::algorithm::trim_copy( raw );
                if ( line.empty() ) {
                    continue;
                }

                auto const is_ignored = std::any_of(
                    ops.ignored_prefixes.cbegin(),
                    ops.ignored_prefixes.cend(),
                    [&]( std::string const& prefix ) { return boost::algorithm::starts_with( line, prefix ); }
                    );
                if ( is_ignored ) {
                    continue;
                }

                if ( skipped < ops.skip_lines ) {
                    ++skipped;
                    continue;
                }

                names.push_back( line.substr( 0, line.find_first_of( " \t" ) ) );
            }

            return names;
        }

        auto unsupported_result( std::string const& language )
            -> package_install_result
        {
            return package_install_result{
                false,
                "",
                "",
                0,
                {},
                execution_error::unsupported_language,
                "Package management is not supported for " + language
            };
        }
    }


    auto resolve_package_operations( std::string const& language )
        -> boost::optional<package_operations const&>
    {
        for( auto const& row : operations() ) {
            if ( row.first == language ) {
                return row.second;
            }
        }

        return boost::none;
    }

    auto package_languages()
        -> std::vector<std::string>
    {
        std::vector<std::string> names;
        for( auto const& row : operations() ) {
            names.push_back( row.first );
        }

        return names;
    }

    auto is_valid_package_specifier( std::string const& specifier )
        -> bool
    {
        if ( specifier.empty() || specifier[0] == '-' ) {
            return false;
        }

        return std::all_of( specifier.cbegin(), specifier.cend(), []( char const c ) {
                return std::isalnum( static_cast<unsigned char>( c ) )
                    || std::string( "@/._:=<>~^+-[]," ).find( c ) != std::string::npos;
            });
    }

    auto parse_package_list( package_operations const& ops, std::string const& output )
        -> boost::optional<std::vector<std::string>>
    {
        switch( ops.list_format ) {
        case package_list_format::json_dependency_map:
            return parse_dependency_map( output );

        case package_list_format::json_package_array:
            return parse_package_array( output );

        case package_list_format::line_first_token:
            return parse_lines( ops, output );
        }

        return boost::none;
    }

    auto to_string( package_list_status const status )
        -> char const*
    {
        switch( status ) {
        case package_list_status::ok:
            return "ok";
        case package_list_status::unparseable:
            return "unparseable";
        case package_list_status::execution_failed:
            return "execution_failed";
        case package_list_status::unsupported_language:
            return "unsupported_language";
        }

        return "unknown";
    }

    std::ostream& operator<<( std::ostream& os, package_install_result const& result )
    {
        os << "package_install_result" << std::endl
           << "  success : " << std::boolalpha << result.success << std::endl
           << "  duration: " << result.duration_milli_sec << "ms" << std::endl
           << "  packages: " << boost::algorithm::join( result.installed_packages, ", " ) << std::endl
           << "  message : " << result.message << std::endl
            ;

        if ( result.error ) {
            os << "  error   : " << to_string( *result.error ) << std::endl;
        }

        return os;
    }


    package_manager::package_manager( execution_runtime& runtime )
        : runtime_( runtime )
    {}

    auto package_manager::install_packages( package_install_request const& request )
        -> package_install_result
    {
        return modify_packages(
            request.project_id,
            request.language,
            request.packages,
            request.working_dir,
            true
            );
    }

    auto package_manager::initialize_project( std::string const& project_id, std::string const& language )
        -> package_install_result
    {
        auto const ops = resolve_package_operations( language );
        if ( !ops ) {
            return unsupported_result( language );
        }

        std::vector<std::string> steps = {
            boost::algorithm::replace_all_copy( ops->init_command, "{project}", shell_quote( project_id ) )
        };
        if ( auto const config = resolve_language( language ) ) {
            // tools the default command needs, executions themselves run offline
            steps.insert( steps.end(), config->setup.cbegin(), config->setup.cend() );
        }

        auto const line = boost::algorithm::join( steps, " && " );
        auto const r = run_operation( project_id, language, line, boost::none );

        bool const success = r.exit_code == 0 && !r.error;
        return package_install_result{
            success,
            r.stdout_text,
            r.stderr_text,
            r.duration_milli_sec,
            {},
            r.error,
            success
                ? "Initialized " + ops->package_file
                : "Failed to initialize " + ops->package_file
        };
    }

    auto package_manager::get_installed_packages( std::string const& project_id, std::string const& language )
        -> package_list_result
    {
        auto const ops = resolve_package_operations( language );
        if ( !ops ) {
            return package_list_result{ package_list_status::unsupported_language, {}, "" };
        }

        auto const r = run_operation( project_id, language, ops->list_command, boost::none );
        if ( r.error ) {
            log_line( severity::warn ) << "Listing packages of " << project_id << " failed: " << to_string( *r.error );
            return package_list_result{ package_list_status::execution_failed, {}, r.stdout_text + r.stderr_text };
        }

        // package tools exit non-zero on warnings such as extraneous packages
        // while still printing a complete list
        if ( auto const packages = parse_package_list( *ops, r.stdout_text ) ) {
            return package_list_result{ package_list_status::ok, *packages, r.stdout_text };
        }

        if ( r.exit_code != 0 ) {
            return package_list_result{ package_list_status::execution_failed, {}, r.stdout_text + r.stderr_text };
        }

        log_line( severity::warn ) << "Unparseable package list of " << project_id << " (" << language << ")";
        return package_list_result{ package_list_status::unparseable, {}, r.stdout_text };
    }

    auto package_manager::installed_package_names( std::string const& project_id, std::string const& language )
        -> std::vector<std::string>
    {
        auto const result = get_installed_packages( project_id, language );
        if ( result.status != package_list_status::ok ) {
            return {};
        }

        return result.packages;
    }

    auto package_manager::remove_packages(
        std::string const& project_id,
        std::string const& language,
        std::vector<std::string> const& packages
        )
        -> package_install_result
    {
        return modify_packages( project_id, language, packages, boost::none, false );
    }

    auto package_manager::get_supported_languages() const
        -> std::vector<std::string>
    {
        return package_languages();
    }

    auto package_manager::get_package_file( std::string const& language ) const
        -> boost::optional<std::string>
    {
        auto const ops = resolve_package_operations( language );
        if ( !ops ) {
            return boost::none;
        }

        return ops->package_file;
    }

    auto package_manager::run_operation(
        std::string const& project_id,
        std::string const& language,
        std::string const& line,
        boost::optional<std::string> const& working_dir
        )
        -> execution_result
    {
        log_line( severity::info ) << "Package operation for " << project_id << " (" << language << "): " << line;

        execution_request request;
        request.project_id = project_id;
        request.language = language;
        request.command = "sh -c " + shell_quote( line );
        request.working_dir = working_dir;

        return runtime_.execute_package_operation( std::move( request ) );
    }

    auto package_manager::modify_packages(
        std::string const& project_id,
        std::string const& language,
        std::vector<std::string> const& packages,
        boost::optional<std::string> const& working_dir,
        bool const is_install
        )
        -> package_install_result
    {
        auto const ops = resolve_package_operations( language );
        if ( !ops ) {
            return unsupported_result( language );
        }

        auto const invalid = std::find_if_not( packages.cbegin(), packages.cend(), is_valid_package_specifier );
        if ( packages.empty() || invalid != packages.cend() ) {
            return package_install_result{
                false,
                "",
                "",
                0,
                {},
                execution_error::validation_failed,
                packages.empty()
                    ? std::string( "No packages given" )
                    : "Invalid package specifier: \"" + *invalid + "\""
            };
        }

        auto const& command_template = is_install ? ops->install_command : ops->remove_command;
        auto const suffix = is_install ? std::string() : ops->remove_suffix;
        auto const line = boost::algorithm::replace_all_copy(
            command_template,
            "{packages}",
            quote_packages( packages, suffix )
            );

        auto const r = run_operation( project_id, language, line, working_dir );

        bool const success = r.exit_code == 0 && !r.error;

        std::stringstream message;
        if ( success ) {
            message << ( is_install ? "Installed " : "Removed " ) << packages.size() << " package(s)";
        } else if ( r.error ) {
            message << "Package operation failed: " << to_string( *r.error );
        } else {
            message << "Package operation exited with code " << r.exit_code;
        }

        return package_install_result{
            success,
            r.stdout_text,
            r.stderr_text,
            r.duration_milli_sec,
            success ? packages : std::vector<std::string>{},
            r.error,
            message.str()
        };
    }

} // namespace kiln
