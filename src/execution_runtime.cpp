//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "execution_runtime.hpp"

#include <array>
#include <sstream>
#include <utility>

#include <boost/algorithm/string/replace.hpp>
#include <boost/chrono.hpp>
#include <boost/optional.hpp>
#include <boost/scope_exit.hpp>
#include <boost/thread/future.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/thread.hpp>

#include "frame_decoder.hpp"
#include "utility.hpp"


namespace kiln
{
    namespace
    {
        using steady_clock = boost::chrono::steady_clock;

        auto elapsed_milli_sec( steady_clock::time_point const since )
            -> std::uint64_t
        {
            return static_cast<std::uint64_t>(
                boost::chrono::duration_cast<boost::chrono::milliseconds>( steady_clock::now() - since ).count()
                );
        }

        void fail(
            execution_result& result,
            execution_error const error,
            std::string const& message
            )
        {
            result.exit_code = 1;
            result.error = error;

            if ( !result.stderr_text.empty() && result.stderr_text.back() != '\n' ) {
                result.stderr_text += '\n';
            }
            result.stderr_text += message;
        }

        auto is_valid_command( std::string const& command )
            -> bool
        {
            try {
                return !split_command_line( command ).empty();

            } catch( std::runtime_error const& ) {
                return false;
            }
        }

        void append_bounded(
            std::string& target,
            std::string const& payload,
            std::size_t const limit,
            bool& truncated
            )
        {
            if ( target.size() >= limit ) {
                truncated = true;
                return;
            }

            auto const room = limit - target.size();
            if ( payload.size() > room ) {
                target.append( payload, 0, room );
                truncated = true;
            } else {
                target += payload;
            }
        }
    }


    execution_runtime::execution_runtime(
        std::shared_ptr<container_engine> engine,
        runtime_options_t opts
        )
        : engine_( std::move( engine ) )
        , opts_( std::move( opts ) )
        , gate_( opts_.max_concurrent_containers )
    {
        validate( opts_ );
    }

    void execution_runtime::initialize() noexcept
    {
        log_line( severity::info ) << "Initializing container runtime, staging root: " << opts_.staging_root;

        try {
            ensure_directory( opts_.staging_root );

        } catch( std::exception const& e ) {
            log_line( severity::warn ) << "Failed to create staging root: " << e.what();
        }

        try {
            engine_->ping();

        } catch( std::exception const& e ) {
            log_line( severity::warn ) << "Container engine is not available, container runtime will be limited: "
                                       << e.what();
            return;
        }

        pull_warm_images();

        auto const removed = sweep_stale_containers();
        if ( removed > 0 ) {
            log_line( severity::info ) << "Removed " << removed << " stale containers";
        }

        log_line( severity::info ) << "Container runtime initialized";
    }

    auto execution_runtime::execute_code( execution_request request )
        -> execution_result
    {
        return execute( std::move( request ), "none" );
    }

    auto execution_runtime::execute_package_operation( execution_request request )
        -> execution_result
    {
        return execute( std::move( request ), opts_.package_network_mode );
    }

    auto execution_runtime::execute( execution_request request, std::string const& network_mode )
        -> execution_result
    {
        auto const started = steady_clock::now();

        if ( request.id.empty() ) {
            request.id = make_execution_id();
        }

        auto result = execution_result{ request.id, 1, "", "", 0, boost::none, false };

        try {
            auto const config = resolve_language( request.language );
            if ( !config ) {
                fail( result, execution_error::unsupported_language, "Unsupported language: " + request.language );

            } else if ( !is_valid_project_id( request.project_id ) ) {
                fail( result, execution_error::validation_failed, "Invalid project id: \"" + request.project_id + "\"" );

            } else if ( request.command && !is_valid_command( *request.command ) ) {
                fail( result, execution_error::validation_failed, "Malformed command: " + *request.command );

            } else {
                run_container( request, *config, network_mode, result );
            }

        } catch( workspace_error const& e ) {
            fail( result, execution_error::validation_failed, e.what() );

        } catch( engine_unavailable_error const& e ) {
            fail( result, execution_error::engine_unavailable, e.what() );

        } catch( engine_error const& e ) {
            fail( result, execution_error::execution_failed, e.what() );

        } catch( std::exception const& e ) {
            fail( result, execution_error::execution_failed, e.what() );

        } catch(...) {
            fail( result, execution_error::execution_failed, "Unexpected exception[execute]" );
        }

        result.duration_milli_sec = elapsed_milli_sec( started );

        log_line log( result.error ? severity::warn : severity::info );
        log << "Execution " << result.id << " (" << request.language << ") finished: exit=" << result.exit_code
            << " in " << result.duration_milli_sec << "ms";
        if ( result.error ) {
            log << " [" << to_string( *result.error ) << "]";
        }

        return result;
    }

    void execution_runtime::run_container(
        execution_request const& request,
        language_config const& config,
        std::string const& network_mode,
        execution_result& result
        )
    {
        if ( !register_container( request ) ) {
            fail( result, execution_error::validation_failed, "Execution id is already in use: " + request.id );
            return;
        }

        // the entry never outlives this execution
        BOOST_SCOPE_EXIT_ALL(this, &request) {
            unregister_container( request.id );
        };

        project_lock project_guard( project_locks_, request.project_id, opts_.admission_queue_timeout );
        if ( !project_guard ) {
            log_line( severity::warn ) << "Rejected " << request.id << ": project "
                                       << request.project_id << " is busy";
            fail( result, execution_error::rejected, "Another execution of this project is running, try again later" );
            return;
        }

        admission_slot slot( gate_, opts_.admission_queue_timeout );
        if ( !slot ) {
            log_line( severity::warn ) << "Rejected " << request.id << ": "
                                       << gate_.capacity() << " containers are already running";
            fail( result, execution_error::rejected, "Too many concurrent executions, try again later" );
            return;
        }

        // stop_container may have run while this request was queued
        if ( !is_tracked( request.id ) ) {
            fail( result, execution_error::stopped, "Execution was stopped before start" );
            return;
        }

        // prepare the workspace
        auto const staging_dir = project_staging_dir( opts_.staging_root, request.project_id );
        ensure_directory( staging_dir );
        write_project_files( staging_dir, request.files );
        if ( !request.code.empty() ) {
            write_file( staging_dir / main_file_name( config ), request.code );
        }

        auto const spec = make_container_spec( request, config, staging_dir, network_mode );

        auto const container_id = engine_->create_container( spec );
        log_line( severity::info ) << "Created container " << container_id.substr( 0, 12 )
                                   << " for " << request.id << " (" << config.image << ")";

        // created but never started containers are not auto removed
        bool started = false;
        BOOST_SCOPE_EXIT_ALL(this, &container_id, &started) {
            if ( !started ) {
                try {
                    engine_->remove( container_id );

                } catch( std::exception const& e ) {
                    log_line( severity::warn ) << "Failed to remove container " << container_id.substr( 0, 12 )
                                               << ": " << e.what();
                }
            }
        };

        if ( !update_container( request.id, container_id, container_status::creating ) ) {
            fail( result, execution_error::stopped, "Execution was stopped before start" );
            return;
        }

        auto output = engine_->attach( container_id );
        auto waiter = engine_->prepare_wait( container_id );

        // stream capture
        captured_output captured{ "", "", false, boost::none };
        frame_decoder decoder(
            [&]( stream_kind const kind, std::string const& payload ) {
                auto& target = ( kind == stream_kind::stderr_stream ) ? captured.stderr_text : captured.stdout_text;
                append_bounded( target, payload, opts_.max_output_bytes, captured.truncated );
            });

        boost::thread reader( [&] {
                std::array<char, 8192> buffer;
                try {
                    for(;;) {
                        auto const n = output->read_some( buffer.data(), buffer.size() );
                        if ( n == 0 ) {
                            break;
                        }

                        touch_container( request.id );

                        // a corrupted stream is still read until the container exits
                        if ( decoder.failed() ) {
                            continue;
                        }

                        try {
                            decoder.feed( buffer.data(), n );

                        } catch( frame_error const& e ) {
                            log_line( severity::error ) << "Corrupted output of " << request.id << ": " << e.what();
                            captured.stream_error = std::string( e.what() );
                        }
                    }

                    if ( !captured.stream_error && !decoder.at_frame_boundary() ) {
                        captured.stream_error = std::string( "Output stream ended inside a frame" );
                    }

                } catch( std::exception const& e ) {
                    if ( !captured.stream_error ) {
                        captured.stream_error = std::string( e.what() );
                    }
                }
            });
        BOOST_SCOPE_EXIT_ALL(&output, &reader) {
            if ( reader.joinable() ) {
                output->close();
                reader.join();
            }
        };

        // exit monitor
        boost::promise<boost::optional<int>> p;
        boost::future<boost::optional<int>> f = p.get_future();
        std::string wait_error;

        boost::thread monitor( [&] {
                try {
                    p.set_value( waiter->get() );

                } catch( std::exception const& e ) {
                    wait_error = e.what();
                    p.set_value( boost::none );
                }
            });
        BOOST_SCOPE_EXIT_ALL(&waiter, &monitor) {
            if ( monitor.joinable() ) {
                waiter->cancel();
                monitor.join();
            }
        };

        if ( !update_container( request.id, container_id, container_status::running ) ) {
            fail( result, execution_error::stopped, "Execution was stopped before start" );
            return;
        }

        engine_->start( container_id );
        started = true;

        // stop_container may have run between the update and the start
        if ( !is_tracked( request.id ) ) {
            try {
                engine_->kill( container_id );

            } catch( engine_error const& e ) {
                log_line( severity::warn ) << "Failed to kill container " << container_id.substr( 0, 12 )
                                           << ": " << e.what();
            }
        }

        // race the exit against the timer
        if ( f.wait_for( opts_.execution_timeout ) == boost::future_status::timeout ) {
            log_line( severity::warn ) << "Timer timeout! kill container " << container_id.substr( 0, 12 )
                                       << " of " << request.id;
            result.timed_out = true;

            try {
                engine_->kill( container_id );

            } catch( engine_error const& e ) {
                log_line( severity::error ) << "Failed to kill container " << container_id.substr( 0, 12 )
                                            << ": " << e.what();
            }

            // the wait returns once the killed container is gone
            if ( f.wait_for( opts_.output_drain_timeout ) == boost::future_status::timeout ) {
                waiter->cancel();
            }
        }

        auto const exit_code = f.get();
        monitor.join();

        // the engine closes the stream when the container exits
        if ( !reader.try_join_for( opts_.output_drain_timeout ) ) {
            output->close();
            reader.join();
        }

        update_container( request.id, container_id, container_status::stopped );
        bool const stopped = !is_tracked( request.id );

        result.stdout_text = std::move( captured.stdout_text );
        result.stderr_text = std::move( captured.stderr_text );
        if ( captured.truncated ) {
            log_line( severity::warn ) << "Output of " << request.id << " was truncated";
        }

        if ( result.timed_out ) {
            std::stringstream ss;
            ss << "Execution timed out after " << opts_.execution_timeout.count() << "ms";
            fail( result, execution_error::timeout, ss.str() );

        } else if ( stopped ) {
            fail( result, execution_error::stopped, "Execution was stopped" );

        } else if ( !exit_code ) {
            fail( result, execution_error::execution_failed, wait_error );

        } else if ( captured.stream_error ) {
            fail( result, execution_error::stream_corrupted, *captured.stream_error );

        } else {
            result.exit_code = *exit_code;
        }
    }

    auto execution_runtime::make_container_spec(
        execution_request const& request,
        language_config const& config,
        fs::path const& staging_dir,
        std::string const& network_mode
        ) const
        -> container_spec
    {
        std::vector<std::string> commands;
        if ( request.command ) {
            commands = split_command_line( *request.command );
        } else {
            commands = config.command;
            commands.push_back( main_file_name( config ) );
        }

        // request values win over the language defaults
        std::map<std::string, std::string> environment;
        for( auto const& env : config.environment ) {
            environment[env.first] =
                boost::algorithm::replace_all_copy( env.second, "{workspace}", opts_.container_workspace );
        }
        for( auto const& env : request.environment ) {
            environment[env.first] = env.second;
        }

        std::vector<std::string> envs;
        for( auto const& env : environment ) {
            envs.push_back( env.first + "=" + env.second );
        }

        auto working_dir = opts_.container_workspace;
        if ( request.working_dir && !request.working_dir->empty() ) {
            working_dir = ( ( *request.working_dir )[0] == '/' )
                ? *request.working_dir
                : opts_.container_workspace + "/" + *request.working_dir
                ;
        }

        return container_spec{
            config.image,
            std::move( commands ),
            std::move( envs ),
            working_dir,
            mount_point{ staging_dir, opts_.container_workspace, false },

            opts_.limits.memory_bytes,
            opts_.limits.cpu_quota,
            opts_.limits.cpu_period,
            opts_.limits.pids_limit,

            network_mode,
            true,               // auto remove

            {
                { ManagedLabel, "true" },
                { ExecutionIdLabel, request.id },
                { ProjectIdLabel, request.project_id },
            }
        };
    }

    auto execution_runtime::get_active_containers() const
        -> std::vector<container_info>
    {
        boost::lock_guard<boost::mutex> lock( containers_mutex_ );

        std::vector<container_info> snapshot;
        snapshot.reserve( containers_.size() );
        for( auto const& c : containers_ ) {
            snapshot.push_back( c.second );
        }

        return snapshot;
    }

    auto execution_runtime::stop_container( std::string const& id )
        -> bool
    {
        std::string container_id;
        {
            boost::lock_guard<boost::mutex> lock( containers_mutex_ );

            auto const it = containers_.find( id );
            if ( it == containers_.end() ) {
                return false;
            }

            container_id = it->second.container_id;
            containers_.erase( it );
        }

        log_line( severity::info ) << "Stop requested for " << id;

        // not created yet, the execution notices the missing entry by itself
        if ( container_id.empty() ) {
            return true;
        }

        try {
            engine_->kill( container_id );

        } catch( engine_error const& e ) {
            log_line( severity::warn ) << "Failed to kill container " << container_id.substr( 0, 12 )
                                       << ": " << e.what();
        }

        return true;
    }

    auto execution_runtime::get_language_support() const
        -> std::vector<std::string>
    {
        return language_names();
    }

    auto execution_runtime::health_check()
        -> health_report
    {
        auto report = health_report{
            health_status::healthy,
            get_active_containers().size(),
            language_names().size(),
            true,
            boost::none
        };

        try {
            engine_->ping();

        } catch( std::exception const& e ) {
            report.status = health_status::degraded;
            report.engine_connected = false;
            report.error = std::string( e.what() );
        }

        return report;
    }

    auto execution_runtime::sweep_stale_containers()
        -> std::size_t
    {
        auto const now = wall_clock::now();
        auto const threshold = wall_clock::to_time_t( now ) - opts_.retention_window.count();

        std::size_t removed = 0;

        // entries of this process
        std::vector<std::string> stale_ids;
        {
            boost::lock_guard<boost::mutex> lock( containers_mutex_ );
            for( auto const& c : containers_ ) {
                if ( now - c.second.created_at > opts_.retention_window ) {
                    stale_ids.push_back( c.first );
                }
            }
        }
        for( auto const& id : stale_ids ) {
            if ( stop_container( id ) ) {
                ++removed;
            }
        }

        // leftovers in the engine, e.g. from a crashed process
        try {
            for( auto const& c : engine_->list_managed() ) {
                if ( c.created >= threshold ) {
                    continue;
                }

                try {
                    engine_->remove( c.id );
                    ++removed;
                    log_line( severity::info ) << "Removed stale container " << c.id.substr( 0, 12 );

                } catch( engine_error const& e ) {
                    log_line( severity::warn ) << "Failed to remove stale container " << c.id.substr( 0, 12 )
                                               << ": " << e.what();
                }
            }

        } catch( std::exception const& e ) {
            log_line( severity::warn ) << "Container cleanup failed: " << e.what();
        }

        return removed;
    }

    auto execution_runtime::options() const
        -> runtime_options_t const&
    {
        return opts_;
    }

    auto execution_runtime::register_container( execution_request const& request )
        -> bool
    {
        auto const now = wall_clock::now();

        boost::lock_guard<boost::mutex> lock( containers_mutex_ );
        return containers_.emplace(
            request.id,
            container_info{
                request.id,
                request.project_id,
                "",
                request.language,
                container_status::creating,
                now,
                now
            }
            ).second;
    }

    auto execution_runtime::update_container(
        std::string const& id,
        std::string const& container_id,
        container_status const status
        )
        -> bool
    {
        boost::lock_guard<boost::mutex> lock( containers_mutex_ );

        auto const it = containers_.find( id );
        if ( it == containers_.end() ) {
            return false;
        }

        it->second.container_id = container_id;
        it->second.status = status;
        it->second.last_activity = wall_clock::now();

        return true;
    }

    void execution_runtime::touch_container( std::string const& id )
    {
        boost::lock_guard<boost::mutex> lock( containers_mutex_ );

        auto const it = containers_.find( id );
        if ( it != containers_.end() ) {
            it->second.last_activity = wall_clock::now();
        }
    }

    auto execution_runtime::is_tracked( std::string const& id ) const
        -> bool
    {
        boost::lock_guard<boost::mutex> lock( containers_mutex_ );
        return containers_.find( id ) != containers_.end();
    }

    void execution_runtime::unregister_container( std::string const& id ) noexcept
    {
        boost::lock_guard<boost::mutex> lock( containers_mutex_ );
        containers_.erase( id );
    }

    void execution_runtime::pull_warm_images() noexcept
    {
        try {
            auto engine = engine_;
            auto const images = opts_.warm_images;

            // a slow registry must not block startup, the pull goes on in the background
            boost::thread puller( [engine, images] {
                    for( auto const& image : images ) {
                        try {
                            engine->pull_image( image );
                            log_line( severity::info ) << "Pulled " << image;

                        } catch( std::exception const& e ) {
                            log_line( severity::error ) << "Failed to pull " << image << ": " << e.what();
                        }
                    }
                });

            if ( !puller.try_join_for( opts_.image_pull_timeout ) ) {
                log_line( severity::warn ) << "Image pull did not finish within "
                                           << opts_.image_pull_timeout.count() << "ms, continuing without it";
                puller.detach();
            }

        } catch( std::exception const& e ) {
            log_line( severity::warn ) << "Failed to pull images: " << e.what();
        }
    }

} // namespace kiln
