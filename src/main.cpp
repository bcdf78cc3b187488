//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/program_options.hpp>
#include <boost/range/algorithm_ext/erase.hpp>

#include "docker_engine.hpp"
#include "execution_runtime.hpp"
#include "language_registry.hpp"
#include "package_manager.hpp"
#include "result_json.hpp"
#include "runtime_options.hpp"
#include "utility.hpp"


namespace
{
    namespace po = boost::program_options;
    namespace fs = boost::filesystem;

    auto read_whole_file( fs::path const& path )
        -> std::string
    {
        fs::ifstream ifs( path, std::ios::binary );
        if ( !ifs ) {
            throw std::runtime_error( "Failed to open " + path.string() );
        }

        return std::string( std::istreambuf_iterator<char>( ifs ), std::istreambuf_iterator<char>() );
    }

    // "key=value" -> { key, value }
    auto split_pair( std::string const& v, std::string const& what )
        -> std::pair<std::string, std::string>
    {
        auto const pos = v.find( '=' );
        if ( pos == std::string::npos || pos == 0 ) {
            throw std::runtime_error( "invalid " + what + " option: " + v );
        }

        return { v.substr( 0, pos ), v.substr( pos + 1 ) };
    }

    auto required( po::variables_map const& vm, std::string const& key )
        -> std::string const&
    {
        if ( !vm.count( key ) ) {
            throw std::runtime_error( "--" + key + " is required" );
        }

        return vm[key].as<std::string>();
    }

    auto make_run_request( po::variables_map const& vm )
        -> kiln::execution_request
    {
        if ( vm.count( "request" ) ) {
            return kiln::parse_execution_request( vm["request"].as<std::string>() );
        }

        if ( vm.count( "request-file" ) ) {
            return kiln::parse_execution_request( read_whole_file( vm["request-file"].as<std::string>() ) );
        }

        kiln::execution_request request;
        request.project_id = required( vm, "project" );
        request.language = required( vm, "language" );

        if ( vm.count( "code" ) ) {
            request.code = vm["code"].as<std::string>();
        } else if ( vm.count( "code-file" ) ) {
            request.code = read_whole_file( vm["code-file"].as<std::string>() );
        }

        if ( vm.count( "command" ) ) {
            request.command = vm["command"].as<std::string>();
        }

        if ( vm.count( "env" ) ) {
            for( auto&& v : vm["env"].as<std::vector<std::string>>() ) {
                auto const kv = split_pair( v, "env" );
                request.environment[kv.first] = kv.second;
            }
        }

        if ( vm.count( "workdir" ) ) {
            request.working_dir = vm["workdir"].as<std::string>();
        }

        // relative-path-in-workspace=host-path
        if ( vm.count( "file" ) ) {
            for( auto&& v : vm["file"].as<std::vector<std::string>>() ) {
                auto const kv = split_pair( v, "file" );
                request.files[kv.first] = read_whole_file( kv.second );
            }
        }

        return request;
    }

    auto packages_argument( po::variables_map const& vm )
        -> std::vector<std::string>
    {
        if ( !vm.count( "args" ) ) {
            return {};
        }

        auto packages = vm["args"].as<std::vector<std::string>>();
        return boost::remove_erase( packages, "" );  // remove empty
    }
}


int main( int argc, char* argv[] )
{
    // Runtime options, also accepted from the config file
    po::options_description runtime( "Runtime options" );
    runtime.add_options()
        ( "staging-root", po::value<std::string>(), "staging dirs will be $staging-root/$project" )
        ( "workspace", po::value<std::string>(), "workspace path in containers (Ex. /workspace)" )

        ( "socket", po::value<std::string>(), "docker daemon socket" )
        ( "api-version", po::value<std::string>(), "docker engine api version (Ex. v1.41)" )
        ( "request-timeout", po::value<unsigned int>(), "engine request timeout [ms]" )

        ( "timeout", po::value<unsigned int>(), "execution timeout [ms]" )
        ( "drain-timeout", po::value<unsigned int>(), "output drain grace period [ms]" )
        ( "max-output", po::value<std::size_t>(), "max captured bytes per stream" )

        ( "memory", po::value<std::uint64_t>(), "memory limit [bytes]" )
        ( "cpu-quota", po::value<std::int64_t>(), "cpu quota [us per period]" )
        ( "cpu-period", po::value<std::int64_t>(), "cpu period [us]" )
        ( "pids", po::value<std::int64_t>(), "pids limit" )

        ( "max-concurrent", po::value<std::size_t>(), "max concurrent containers" )
        ( "queue-timeout", po::value<unsigned int>(), "admission queue timeout [ms]" )

        ( "package-network", po::value<std::string>(), "network mode of package operations" )

        ( "retention", po::value<unsigned int>(), "stale container retention window [s]" )
        ( "warm-image", po::value<std::vector<std::string>>(), "images pulled on warm up" )
        ( "pull-timeout", po::value<unsigned int>(), "warm up image pull budget [ms]" )
        ;

    // Generic options
    po::options_description generic( "Generic options" );
    generic.add_options()
        ( "config", po::value<std::string>(), "config file of runtime options" )
        ( "warm-up", "ping the engine, pull images and sweep before the command" )

        ( "project", po::value<std::string>(), "project id" )
        ( "language", po::value<std::string>(), "language" )
        ( "code", po::value<std::string>(), "source code" )
        ( "code-file", po::value<std::string>(), "file of source code" )
        ( "command", po::value<std::string>(), "command line in container" )
        ( "env", po::value<std::vector<std::string>>(), "env variables (KEY=VALUE)" )
        ( "workdir", po::value<std::string>(), "working directory in container" )
        ( "file", po::value<std::vector<std::string>>(), "relative-path=host-path" )
        ( "request", po::value<std::string>(), "execution request as json" )
        ( "request-file", po::value<std::string>(), "file of execution request json" )

        ( "result-fd", po::value<int>(), "fd can get detail of result" )

        ( "help", "produce help message" )
        ;

    po::options_description hidden( "Hidden options" );
    hidden.add_options()
        ( "subcommand", po::value<std::string>(), "run|terminal|install|init|list|remove|languages|health|sweep" )
        ( "args", po::value<std::vector<std::string>>(), "args" )
        ;

    po::options_description cmdline_options;
    cmdline_options
        .add( runtime )
        .add( generic )
        .add( hidden )
        ;

    po::positional_options_description p;
    p.add( "subcommand", 1 );
    p.add( "args", -1 );

    try {
        po::variables_map vm;
        po::store(
            po::command_line_parser( argc, argv )
                .options( cmdline_options )
                .positional( p )
                .run(),
            vm
            );

        // command line wins over the config file
        if ( vm.count( "config" ) ) {
            auto const& path = vm["config"].as<std::string>();
            fs::ifstream ifs( path );
            if ( !ifs ) {
                throw std::runtime_error( "Failed to open config file " + path );
            }
            po::store( po::parse_config_file( ifs, runtime ), vm );
        }
        po::notify( vm );

        //
        if ( vm.count( "help" ) || !vm.count( "subcommand" ) ) {
            std::cout << "Usage: kiln [options] <run|terminal|install|init|list|remove|languages|health|sweep> [packages...]"
                      << std::endl
                      << cmdline_options << std::endl;
            return vm.count( "help" ) ? 0 : 1;
        }

        // default option
        auto opts = kiln::default_runtime_options();

        if ( vm.count( "staging-root" ) ) {
            opts.staging_root = vm["staging-root"].as<std::string>();
        }
        if ( vm.count( "workspace" ) ) {
            opts.container_workspace = vm["workspace"].as<std::string>();
        }

        if ( vm.count( "socket" ) ) {
            opts.engine_socket = vm["socket"].as<std::string>();
        }
        if ( vm.count( "api-version" ) ) {
            opts.engine_api_version = vm["api-version"].as<std::string>();
        }
        if ( vm.count( "request-timeout" ) ) {
            opts.engine_request_timeout = boost::chrono::milliseconds( vm["request-timeout"].as<unsigned int>() );
        }

        if ( vm.count( "timeout" ) ) {
            opts.execution_timeout = boost::chrono::milliseconds( vm["timeout"].as<unsigned int>() );
        }
        if ( vm.count( "drain-timeout" ) ) {
            opts.output_drain_timeout = boost::chrono::milliseconds( vm["drain-timeout"].as<unsigned int>() );
        }
        if ( vm.count( "max-output" ) ) {
            opts.max_output_bytes = vm["max-output"].as<std::size_t>();
        }

        {
            if ( vm.count( "memory" ) ) {
                opts.limits.memory_bytes
                    = vm["memory"].as<std::uint64_t>();
            }

            if ( vm.count( "cpu-quota" ) ) {
                opts.limits.cpu_quota
                    = vm["cpu-quota"].as<std::int64_t>();
            }

            if ( vm.count( "cpu-period" ) ) {
                opts.limits.cpu_period
                    = vm["cpu-period"].as<std::int64_t>();
            }

            if ( vm.count( "pids" ) ) {
                opts.limits.pids_limit
                    = vm["pids"].as<std::int64_t>();
            }
        }

        if ( vm.count( "max-concurrent" ) ) {
            opts.max_concurrent_containers = vm["max-concurrent"].as<std::size_t>();
        }
        if ( vm.count( "queue-timeout" ) ) {
            opts.admission_queue_timeout = boost::chrono::milliseconds( vm["queue-timeout"].as<unsigned int>() );
        }

        if ( vm.count( "package-network" ) ) {
            opts.package_network_mode = vm["package-network"].as<std::string>();
        }

        if ( vm.count( "retention" ) ) {
            opts.retention_window = boost::chrono::seconds( vm["retention"].as<unsigned int>() );
        }
        if ( vm.count( "warm-image" ) ) {
            auto images = vm["warm-image"].as<std::vector<std::string>>();
            opts.warm_images = boost::remove_erase( images, "" );  // remove empty
        }
        if ( vm.count( "pull-timeout" ) ) {
            opts.image_pull_timeout = boost::chrono::milliseconds( vm["pull-timeout"].as<unsigned int>() );
        }

        int const result_fd = vm.count( "result-fd" ) ? vm["result-fd"].as<int>() : 1;

        kiln::validate( opts );
        kiln::log_line( kiln::severity::info ) << opts;

        // pulls on demand may take minutes, unlike the warm up budget
        auto const engine = std::make_shared<kiln::docker_engine>(
            opts.engine_socket,
            opts.engine_api_version,
            opts.engine_request_timeout,
            boost::chrono::minutes( 10 )
            );
        kiln::execution_runtime rt( engine, opts );
        kiln::package_manager pm( rt );

        if ( vm.count( "warm-up" ) ) {
            rt.initialize();
        }

        auto const& subcommand = vm["subcommand"].as<std::string>();

        picojson::value result;
        bool succeeded = true;

        if ( subcommand == "run" ) {
            auto const r = rt.execute_code( make_run_request( vm ) );
            succeeded = r.exit_code == 0 && !r.error;
            result = kiln::to_json( r );

        } else if ( subcommand == "terminal" ) {
            auto const& command = required( vm, "command" );

            kiln::execution_request request;
            request.project_id = required( vm, "project" );
            request.language = kiln::language_for_command( command );
            request.command = command;

            auto const r = rt.execute_code( std::move( request ) );
            succeeded = r.exit_code == 0 && !r.error;
            result = kiln::to_json( r );

        } else if ( subcommand == "install" ) {
            auto const r = pm.install_packages(
                kiln::package_install_request{
                    required( vm, "project" ),
                    required( vm, "language" ),
                    packages_argument( vm ),
                    vm.count( "workdir" )
                        ? boost::optional<std::string>( vm["workdir"].as<std::string>() )
                        : boost::none
                });
            succeeded = r.success;
            result = kiln::to_json( r );

        } else if ( subcommand == "init" ) {
            auto const r = pm.initialize_project( required( vm, "project" ), required( vm, "language" ) );
            succeeded = r.success;
            result = kiln::to_json( r );

        } else if ( subcommand == "list" ) {
            auto const r = pm.get_installed_packages( required( vm, "project" ), required( vm, "language" ) );
            succeeded = r.status == kiln::package_list_status::ok;
            result = kiln::to_json( r );

        } else if ( subcommand == "remove" ) {
            auto const r = pm.remove_packages(
                required( vm, "project" ),
                required( vm, "language" ),
                packages_argument( vm )
                );
            succeeded = r.success;
            result = kiln::to_json( r );

        } else if ( subcommand == "languages" ) {
            picojson::value::object obj{
                { "languages", kiln::to_json( rt.get_language_support() ) },
                { "packageLanguages", kiln::to_json( pm.get_supported_languages() ) },
            };
            result = picojson::value( obj );

        } else if ( subcommand == "health" ) {
            auto const r = rt.health_check();
            succeeded = r.status == kiln::health_status::healthy;
            result = kiln::to_json( r );

        } else if ( subcommand == "sweep" ) {
            picojson::value::object obj{
                { "removed", picojson::value( static_cast<double>( rt.sweep_stale_containers() ) ) },
            };
            result = picojson::value( obj );

        } else {
            throw std::runtime_error( "unknown subcommand: " + subcommand );
        }

        if ( !kiln::export_json_to_fd( result, result_fd ) ) {
            return -1;
        }

        return succeeded ? 0 : 1;

    } catch( std::exception const& e ) {
        std::cerr << "Exception: " << std::endl
                  << e.what() << std::endl;
        return -10;

    } catch(...) {
        std::cerr << "Unexpected exception: " << std::endl;
        return -20;
    }
}
