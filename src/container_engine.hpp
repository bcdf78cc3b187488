//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <cstdint>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>


namespace kiln
{
    namespace fs = boost::filesystem;

    // every container created by kiln carries these labels
    constexpr char const* ManagedLabel = "kiln.managed";
    constexpr char const* ExecutionIdLabel = "kiln.execution-id";
    constexpr char const* ProjectIdLabel = "kiln.project-id";

    class engine_error
        : public std::runtime_error
    {
    public:
        explicit engine_error( std::string const& message, unsigned const status = 0 )
            : std::runtime_error( message )
            , status_( status )
        {}

        // HTTP status of the failed engine call, 0 if the call did not get that far
        auto status() const
            -> unsigned
        {
            return status_;
        }

    private:
        unsigned status_;
    };

    // the daemon could not be reached or did not answer in time
    class engine_unavailable_error
        : public engine_error
    {
    public:
        explicit engine_unavailable_error( std::string const& message )
            : engine_error( message )
        {}
    };

    struct mount_point
    {
        fs::path host_path;
        std::string guest_path;

        bool is_readonly;
    };

    struct container_spec
    {
        std::string image;
        std::vector<std::string> commands;
        std::vector<std::string> envs;      // "NAME=value"
        std::string working_dir;
        mount_point mount;

        std::uint64_t memory_bytes;
        std::int64_t cpu_quota;             // micro seconds per cpu_period
        std::int64_t cpu_period;
        std::int64_t pids_limit;

        std::string network_mode;
        bool auto_remove;

        std::map<std::string, std::string> labels;
    };

    struct container_summary
    {
        std::string id;
        std::time_t created;
        std::string state;
        std::map<std::string, std::string> labels;
    };

    // combined stdout/stderr byte stream of an attached container
    class output_stream
    {
    public:
        virtual ~output_stream() = default;

        // blocks until some bytes are available. returns 0 at the end of the stream.
        // throws engine_error
        virtual auto read_some( char* buffer, std::size_t size )
            -> std::size_t = 0;

        // may be called from another thread, a blocked read_some returns 0
        virtual void close() noexcept = 0;
    };

    // a wait request registered to the engine before the container is started
    class exit_waiter
    {
    public:
        virtual ~exit_waiter() = default;

        // blocks until the container exits and returns its exit code. throws engine_error
        virtual auto get()
            -> int = 0;

        // may be called from another thread, a blocked get throws engine_error
        virtual void cancel() noexcept = 0;
    };

    class container_engine
    {
    public:
        virtual ~container_engine() = default;

        virtual void ping() = 0;

        virtual void pull_image( std::string const& reference ) = 0;

        virtual auto create_container( container_spec const& spec )
            -> std::string = 0;

        virtual auto attach( std::string const& container_id )
            -> std::unique_ptr<output_stream> = 0;

        virtual auto prepare_wait( std::string const& container_id )
            -> std::unique_ptr<exit_waiter> = 0;

        virtual void start( std::string const& container_id ) = 0;

        // returns false if the container is not running anymore (or is unknown)
        virtual auto kill( std::string const& container_id )
            -> bool = 0;

        // forced removal. an unknown container is not an error
        virtual void remove( std::string const& container_id ) = 0;

        // containers carrying the management label
        virtual auto list_managed()
            -> std::vector<container_summary> = 0;
    };

    // printer
    std::ostream& operator<<( std::ostream& os, container_spec const& spec );

} // namespace kiln
