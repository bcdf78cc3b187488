//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/thread/mutex.hpp>

#include "admission_gate.hpp"
#include "container_engine.hpp"
#include "execution_types.hpp"
#include "language_registry.hpp"
#include "runtime_options.hpp"
#include "workspace.hpp"


namespace kiln
{
    //
    // Runs user code in ephemeral containers, one container per request.
    //
    // All public operations report failures through their return values,
    // nothing is thrown to the caller. execute_code blocks the calling thread
    // until the container finished, timed out or was stopped.
    //
    class execution_runtime
    {
    public:
        execution_runtime(
            std::shared_ptr<container_engine> engine,
            runtime_options_t opts
            );

        execution_runtime( execution_runtime const& ) = delete;
        execution_runtime& operator=( execution_runtime const& ) = delete;

        // creates the staging root, pings the engine, pulls warm images and
        // sweeps stale containers. every step only logs on failure
        void initialize() noexcept;

        // network mode is always "none"
        auto execute_code( execution_request request )
            -> execution_result;

        // same as execute_code but the container uses the package network mode,
        // so that package managers can reach their registries
        auto execute_package_operation( execution_request request )
            -> execution_result;

        auto get_active_containers() const
            -> std::vector<container_info>;

        auto stop_container( std::string const& id )
            -> bool;

        auto get_language_support() const
            -> std::vector<std::string>;

        auto health_check()
            -> health_report;

        // force removes managed containers older than the retention window,
        // returns the number of removed containers
        auto sweep_stale_containers()
            -> std::size_t;

        auto options() const
            -> runtime_options_t const&;

    private:
        auto execute( execution_request request, std::string const& network_mode )
            -> execution_result;

        struct captured_output
        {
            std::string stdout_text;
            std::string stderr_text;
            bool truncated;
            boost::optional<std::string> stream_error;
        };

        void run_container(
            execution_request const& request,
            language_config const& config,
            std::string const& network_mode,
            execution_result& result
            );

        auto make_container_spec(
            execution_request const& request,
            language_config const& config,
            fs::path const& staging_dir,
            std::string const& network_mode
            ) const
            -> container_spec;

        auto register_container( execution_request const& request )
            -> bool;
        // false if the entry was removed by stop_container
        auto update_container(
            std::string const& id,
            std::string const& container_id,
            container_status const status
            )
            -> bool;
        void touch_container( std::string const& id );
        auto is_tracked( std::string const& id ) const
            -> bool;
        void unregister_container( std::string const& id ) noexcept;

        void pull_warm_images() noexcept;

        std::shared_ptr<container_engine> engine_;
        runtime_options_t const opts_;

        admission_gate gate_;
        project_lock_table project_locks_;

        mutable boost::mutex containers_mutex_;
        std::map<std::string, container_info> containers_;
    };

} // namespace kiln
