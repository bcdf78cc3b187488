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

#include <boost/chrono/duration.hpp>
#include <boost/filesystem/path.hpp>


namespace kiln
{
    namespace fs = boost::filesystem;

    struct resource_limits_t
    {
        std::uint64_t memory_bytes;
        std::int64_t cpu_quota;         // micro seconds per cpu_period
        std::int64_t cpu_period;
        std::int64_t pids_limit;
    };

    struct runtime_options_t
    {
        fs::path staging_root;          // staging dirs are $staging_root/$project_id
        std::string container_workspace;    // Ex. "/workspace"

        fs::path engine_socket;
        std::string engine_api_version;
        boost::chrono::milliseconds engine_request_timeout;

        boost::chrono::milliseconds execution_timeout;
        boost::chrono::milliseconds output_drain_timeout;
        std::size_t max_output_bytes;   // per stream

        resource_limits_t limits;

        std::size_t max_concurrent_containers;
        boost::chrono::milliseconds admission_queue_timeout;

        // execution containers never get a network
        std::string package_network_mode;

        boost::chrono::seconds retention_window;
        std::vector<std::string> warm_images;
        boost::chrono::milliseconds image_pull_timeout;
    };

    auto default_runtime_options()
        -> runtime_options_t;

    // throws std::invalid_argument
    void validate( runtime_options_t const& opts );

    // printer
    std::ostream& operator<<( std::ostream& os, runtime_options_t const& opts );

} // namespace kiln
