//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "runtime_options.hpp"

#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>


namespace kiln
{
    auto default_runtime_options()
        -> runtime_options_t
    {
        return runtime_options_t{
            "/tmp/kiln-containers",
            "/workspace",

            "/var/run/docker.sock",
            "v1.41",
            boost::chrono::seconds{ 30 },       // engine request timeout

            boost::chrono::seconds{ 30 },       // execution timeout
            boost::chrono::seconds{ 2 },        // output drain
            4 * 1024 * 1024,                    // max output per stream

            resource_limits_t{
                512 * 1024 * 1024,              // memory
                50000,                          // 50% of one cpu
                100000,
                256,                            // pids
            },

            8,                                  // concurrent containers
            boost::chrono::seconds{ 5 },        // admission queue

            "bridge",                           // package operations

            boost::chrono::hours{ 1 },          // retention window
            { "node:18-alpine", "python:3.11-alpine" },
            boost::chrono::seconds{ 10 },       // warm image pull
        };
    }

    void validate( runtime_options_t const& opts )
    {
        auto fail = []( std::string const& message ) {
            throw std::invalid_argument( "invalid runtime option: " + message );
        };

        if ( opts.staging_root.empty() || !opts.staging_root.is_absolute() ) {
            fail( "staging root must be an absolute path" );
        }
        if ( opts.container_workspace.empty() || opts.container_workspace[0] != '/' ) {
            fail( "container workspace must be an absolute path" );
        }
        if ( opts.execution_timeout.count() <= 0 ) {
            fail( "execution timeout must be positive" );
        }
        if ( opts.max_concurrent_containers == 0 ) {
            fail( "max concurrent containers must be >= 1" );
        }
        if ( opts.limits.memory_bytes == 0 ) {
            fail( "memory limit must be positive" );
        }
        if ( opts.limits.cpu_period <= 0 || opts.limits.cpu_quota <= 0 ) {
            fail( "cpu quota and period must be positive" );
        }
        if ( opts.package_network_mode.empty() ) {
            fail( "package network mode must not be empty" );
        }
    }

    std::ostream& operator<<( std::ostream& os, runtime_options_t const& opts )
    {
        os << "runtime_options" << std::endl;
        os << "  staging_root       : " << opts.staging_root << std::endl
           << "  container_workspace: " << opts.container_workspace << std::endl
            ;

        os << "  engine: " << std::endl
           << "    socket         : " << opts.engine_socket << std::endl
           << "    api_version    : " << opts.engine_api_version << std::endl
           << "    request_timeout: " << opts.engine_request_timeout.count() << "ms" << std::endl
            ;

        os << "  execution: " << std::endl
           << "    timeout     : " << opts.execution_timeout.count() << "ms" << std::endl
           << "    drain       : " << opts.output_drain_timeout.count() << "ms" << std::endl
           << "    max_output  : " << opts.max_output_bytes << std::endl
            ;

        os << "  limits: " << std::endl;
        {
            auto const& lim = opts.limits;
            os << "    " << "memory : " << lim.memory_bytes << std::endl
               << "    " << "cpu    : " << lim.cpu_quota << " / " << lim.cpu_period << std::endl
               << "    " << "pids   : " << lim.pids_limit << std::endl
                ;
        }

        os << "  admission: " << std::endl
           << "    max_concurrent: " << opts.max_concurrent_containers << std::endl
           << "    queue_timeout : " << opts.admission_queue_timeout.count() << "ms" << std::endl
            ;

        os << "  package_network_mode: " << opts.package_network_mode << std::endl
           << "  retention_window    : " << opts.retention_window.count() << "s" << std::endl
           << "  warm_images         : " << boost::algorithm::join( opts.warm_images, ", " ) << std::endl
           << "  image_pull_timeout  : " << opts.image_pull_timeout.count() << "ms" << std::endl
            ;

        return os;
    }

} // namespace kiln
