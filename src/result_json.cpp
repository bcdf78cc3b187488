//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "result_json.hpp"

#include <iostream>
#include <iterator>

#include <boost/chrono.hpp>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>

#include "utility.hpp"


namespace kiln
{
    namespace bio = boost::iostreams;

    namespace
    {
        auto epoch_milli_sec( wall_clock::time_point const& t )
            -> double
        {
            return static_cast<double>(
                boost::chrono::duration_cast<boost::chrono::milliseconds>( t.time_since_epoch() ).count()
                );
        }

        auto optional_string_member( picojson::object const& obj, std::string const& key )
            -> boost::optional<std::string>
        {
            auto const it = obj.find( key );
            if ( it == obj.cend() || it->second.is<picojson::null>() ) {
                return boost::none;
            }

            if ( !it->second.is<std::string>() ) {
                throw request_format_error( "\"" + key + "\" must be a string" );
            }

            return it->second.get<std::string>();
        }

        auto string_map_member( picojson::object const& obj, std::string const& key )
            -> std::map<std::string, std::string>
        {
            std::map<std::string, std::string> values;

            auto const it = obj.find( key );
            if ( it == obj.cend() || it->second.is<picojson::null>() ) {
                return values;
            }

            if ( !it->second.is<picojson::object>() ) {
                throw request_format_error( "\"" + key + "\" must be an object" );
            }

            for( auto const& kv : it->second.get<picojson::object>() ) {
                if ( !kv.second.is<std::string>() ) {
                    throw request_format_error( "\"" + key + "." + kv.first + "\" must be a string" );
                }
                values.emplace( kv.first, kv.second.get<std::string>() );
            }

            return values;
        }
    }


    auto to_json( execution_result const& result )
        -> picojson::value
    {
        picojson::value::object obj{
            { "success", picojson::value( result.exit_code == 0 && !result.error ) },
            { "output", picojson::value( result.stdout_text ) },
            { "errors", picojson::value( result.stderr_text ) },
            { "exitCode", picojson::value( static_cast<double>( result.exit_code ) ) },
            { "duration", picojson::value( static_cast<double>( result.duration_milli_sec ) ) },
            { "executionId", picojson::value( result.id ) },
            { "timedOut", picojson::value( result.timed_out ) },
        };
        if ( result.error ) {
            obj.emplace( "error", picojson::value( to_string( *result.error ) ) );
        }

        return picojson::value( obj );
    }

    auto to_json( package_install_result const& result )
        -> picojson::value
    {
        picojson::value::object obj{
            { "success", picojson::value( result.success ) },
            { "output", picojson::value( result.stdout_text ) },
            { "errors", picojson::value( result.stderr_text ) },
            { "duration", picojson::value( static_cast<double>( result.duration_milli_sec ) ) },
            { "installedPackages", to_json( result.installed_packages ) },
            { "message", picojson::value( result.message ) },
        };
        if ( result.error ) {
            obj.emplace( "error", picojson::value( to_string( *result.error ) ) );
        }

        return picojson::value( obj );
    }

    auto to_json( package_list_result const& result )
        -> picojson::value
    {
        picojson::value::object obj{
            { "status", picojson::value( to_string( result.status ) ) },
            { "packages", to_json( result.packages ) },
            { "rawOutput", picojson::value( result.raw_output ) },
        };

        return picojson::value( obj );
    }

    auto to_json( health_report const& report )
        -> picojson::value
    {
        picojson::value::object obj{
            { "status", picojson::value( report.status == health_status::healthy ? "healthy" : "degraded" ) },
            { "activeContainers", picojson::value( static_cast<double>( report.active_containers ) ) },
            { "supportedLanguages", picojson::value( static_cast<double>( report.supported_languages ) ) },
            { "dockerConnected", picojson::value( report.engine_connected ) },
        };
        if ( report.error ) {
            obj.emplace( "error", picojson::value( *report.error ) );
        }

        return picojson::value( obj );
    }

    auto to_json( std::vector<container_info> const& containers )
        -> picojson::value
    {
        picojson::value::array arr;
        for( auto const& c : containers ) {
            picojson::value::object obj{
                { "id", picojson::value( c.id ) },
                { "projectId", picojson::value( c.project_id ) },
                { "containerId", picojson::value( c.container_id ) },
                { "language", picojson::value( c.language ) },
                { "status", picojson::value( to_string( c.status ) ) },
                { "createdAt", picojson::value( epoch_milli_sec( c.created_at ) ) },
                { "lastActivity", picojson::value( epoch_milli_sec( c.last_activity ) ) },
            };
            arr.emplace_back( obj );
        }

        return picojson::value( arr );
    }

    auto to_json( std::vector<std::string> const& values )
        -> picojson::value
    {
        picojson::value::array arr;
        for( auto const& v : values ) {
            arr.emplace_back( v );
        }

        return picojson::value( arr );
    }

    auto parse_execution_request( std::string const& json )
        -> execution_request
    {
        picojson::value v;
        auto const err = picojson::parse( v, json );
        if ( !err.empty() ) {
            throw request_format_error( "Malformed request: " + err );
        }
        if ( !v.is<picojson::object>() ) {
            throw request_format_error( "Request must be an object" );
        }

        auto const& obj = v.get<picojson::object>();

        execution_request request;
        request.id = optional_string_member( obj, "id" ).value_or( "" );
        request.project_id = optional_string_member( obj, "projectId" ).value_or( "" );
        request.language = optional_string_member( obj, "language" ).value_or( "" );
        request.code = optional_string_member( obj, "code" ).value_or( "" );
        request.command = optional_string_member( obj, "command" );
        request.environment = string_map_member( obj, "environment" );
        request.working_dir = optional_string_member( obj, "workingDir" );
        request.files = string_map_member( obj, "files" );

        if ( request.project_id.empty() ) {
            throw request_format_error( "\"projectId\" is required" );
        }
        if ( request.language.empty() ) {
            throw request_format_error( "\"language\" is required" );
        }

        return request;
    }

    auto export_json_to_fd( picojson::value const& value, int const fd )
        -> bool
    {
        auto const close_flag = ( fd > 2 )
            ? bio::file_descriptor_flags::close_handle
            : bio::file_descriptor_flags::never_close_handle
            ;
        bio::stream<bio::file_descriptor_sink> ofs( fd, close_flag );
        if ( !ofs ) {
            log_line( severity::error ) << "Failed to create fd stream";
            return false;
        }

        value.serialize( std::ostream_iterator<char>( ofs ) );
        ofs << std::endl;

        return static_cast<bool>( ofs );
    }

} // namespace kiln
