//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "docker_engine.hpp"

#include <atomic>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <sys/socket.h>

#include <picojson.h>

#include "utility.hpp"


namespace kiln
{
    namespace asio = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;

    using local_socket = asio::local::stream_protocol::socket;

    namespace
    {
        constexpr std::uint64_t MaxResponseBodyBytes = 64 * 1024 * 1024;

        struct connection
        {
            asio::io_context ioc;
            local_socket socket{ ioc };
            beast::flat_buffer buffer;
        };

        void connect_socket( local_socket& socket, fs::path const& socket_path )
        {
            beast::error_code ec;
            socket.connect( asio::local::stream_protocol::endpoint( socket_path.string() ), ec );
            if ( ec ) {
                std::stringstream ss;
                ss << "Failed to connect to the container engine at " << socket_path
                   << " : " << ec.message();
                throw engine_unavailable_error( ss.str() );
            }
        }

        // runs queued operations until they complete or the timeout expires.
        // on timeout the socket is closed and false is returned
        auto run_with_timeout(
            asio::io_context& ioc,
            local_socket& socket,
            boost::chrono::milliseconds const timeout
            )
            -> bool
        {
            ioc.restart();
            ioc.run_for( asio::chrono::milliseconds( timeout.count() ) );

            if ( !ioc.stopped() ) {
                beast::error_code ignored;
                socket.close( ignored );
                ioc.run();

                return false;
            }

            return true;
        }

        auto make_request(
            http::verb const verb,
            std::string const& target,
            std::string const& body
            )
            -> http::request<http::string_body>
        {
            http::request<http::string_body> req{ verb, target, 11 };
            req.set( http::field::host, "localhost" );
            req.set( http::field::user_agent, "kiln" );
            if ( !body.empty() ) {
                req.set( http::field::content_type, "application/json" );
                req.body() = body;
            }
            req.prepare_payload();

            return req;
        }

        // writes the request and reads the response header only,
        // bytes following the header are kept in conn.buffer
        template<typename Parser>
        void send_and_read_header(
            connection& conn,
            http::request<http::string_body>& req,
            Parser& parser,
            boost::chrono::milliseconds const timeout
            )
        {
            beast::error_code ec;
            http::async_write(
                conn.socket,
                req,
                [&]( beast::error_code const& write_ec, std::size_t ) {
                    if ( write_ec ) {
                        ec = write_ec;
                        return;
                    }

                    http::async_read_header(
                        conn.socket,
                        conn.buffer,
                        parser,
                        [&]( beast::error_code const& read_ec, std::size_t ) {
                            ec = read_ec;
                        });
                });

            if ( !run_with_timeout( conn.ioc, conn.socket, timeout ) ) {
                std::stringstream ss;
                ss << "Container engine did not answer " << req.target()
                   << " within " << timeout.count() << "ms";
                throw engine_unavailable_error( ss.str() );
            }

            if ( ec ) {
                std::stringstream ss;
                ss << "Engine request failed: " << req.target() << " : " << ec.message();
                throw engine_error( ss.str() );
            }
        }

        auto error_message( std::string const& body )
            -> std::string
        {
            picojson::value v;
            auto const err = picojson::parse( v, body );
            if ( err.empty() && v.is<picojson::object>() ) {
                auto const& obj = v.get<picojson::object>();
                auto const it = obj.find( "message" );
                if ( it != obj.cend() && it->second.is<std::string>() ) {
                    return it->second.get<std::string>();
                }
            }

            return boost::trim_copy( body );
        }

        auto make_error(
            std::string const& what,
            unsigned const status,
            std::string const& body
            )
            -> engine_error
        {
            std::stringstream ss;
            ss << what << " : status=" << status << " : " << error_message( body );
            return engine_error( ss.str(), status );
        }

        auto string_member( picojson::object const& obj, std::string const& key )
            -> std::string
        {
            auto const it = obj.find( key );
            if ( it == obj.cend() || !it->second.is<std::string>() ) {
                return "";
            }

            return it->second.get<std::string>();
        }


        class docker_output_stream
            : public output_stream
        {
        public:
            explicit docker_output_stream( std::unique_ptr<connection> conn )
                : conn_( std::move( conn ) )
                , closed_( false )
            {}

            auto read_some( char* buffer, std::size_t size )
                -> std::size_t override
            {
                // bytes already received together with the response header
                if ( conn_->buffer.size() > 0 ) {
                    auto const n = asio::buffer_copy( asio::buffer( buffer, size ), conn_->buffer.data() );
                    conn_->buffer.consume( n );
                    return n;
                }

                beast::error_code ec;
                auto const n = conn_->socket.read_some( asio::buffer( buffer, size ), ec );
                if ( ec == asio::error::eof || closed_ ) {
                    return 0;
                }
                if ( ec ) {
                    throw engine_error( "Failed to read container output: " + ec.message() );
                }

                return n;
            }

            void close() noexcept override
            {
                closed_ = true;
                ::shutdown( conn_->socket.native_handle(), SHUT_RDWR );
            }

        private:
            std::unique_ptr<connection> conn_;
            std::atomic<bool> closed_;
        };


        class docker_exit_waiter
            : public exit_waiter
        {
        public:
            using parser_type = http::response_parser<http::string_body>;

            docker_exit_waiter(
                std::unique_ptr<connection> conn,
                std::unique_ptr<parser_type> parser
                )
                : conn_( std::move( conn ) )
                , parser_( std::move( parser ) )
                , cancelled_( false )
            {}

            auto get()
                -> int override
            {
                beast::error_code ec;
                http::read( conn_->socket, conn_->buffer, *parser_, ec );
                if ( cancelled_ ) {
                    throw engine_error( "Wait for container was cancelled" );
                }
                if ( ec ) {
                    throw engine_error( "Failed to wait for container: " + ec.message() );
                }

                return parse_wait_response( parser_->get().body() );
            }

            void cancel() noexcept override
            {
                cancelled_ = true;
                ::shutdown( conn_->socket.native_handle(), SHUT_RDWR );
            }

        private:
            std::unique_ptr<connection> conn_;
            std::unique_ptr<parser_type> parser_;
            std::atomic<bool> cancelled_;
        };
    }


    auto parse_image_reference( std::string const& reference )
        -> image_reference
    {
        if ( reference.find( '@' ) != std::string::npos ) {
            return image_reference{ reference, "" };
        }

        // a colon before the last slash belongs to a registry host ("localhost:5000/app")
        auto const last_slash = reference.rfind( '/' );
        auto const colon = reference.rfind( ':' );
        if ( colon != std::string::npos
             && ( last_slash == std::string::npos || colon > last_slash ) ) {
            return image_reference{ reference.substr( 0, colon ), reference.substr( colon + 1 ) };
        }

        return image_reference{ reference, "latest" };
    }

    auto url_encode( std::string const& value )
        -> std::string
    {
        std::stringstream ss;
        ss << std::hex << std::uppercase;

        for( auto const c : value ) {
            auto const u = static_cast<unsigned char>( c );
            if ( std::isalnum( u ) || c == '-' || c == '_' || c == '.' || c == '~' ) {
                ss << c;
            } else {
                ss << '%' << std::setw( 2 ) << std::setfill( '0' ) << static_cast<int>( u );
            }
        }

        return ss.str();
    }

    auto make_container_create_body( container_spec const& spec )
        -> std::string
    {
        picojson::array commands;
        for( auto const& c : spec.commands ) {
            commands.emplace_back( c );
        }

        picojson::array envs;
        for( auto const& e : spec.envs ) {
            envs.emplace_back( e );
        }

        picojson::object labels;
        for( auto const& l : spec.labels ) {
            labels.emplace( l.first, picojson::value( l.second ) );
        }

        auto const bind =
            spec.mount.host_path.string() + ":" + spec.mount.guest_path
            + ( spec.mount.is_readonly ? ":ro" : ":rw" );

        picojson::object host_config{
            { "Binds", picojson::value( picojson::array{ picojson::value( bind ) } ) },
            { "Memory", picojson::value( static_cast<double>( spec.memory_bytes ) ) },
            // no swap on top of the memory ceiling
            { "MemorySwap", picojson::value( static_cast<double>( spec.memory_bytes ) ) },
            { "CpuQuota", picojson::value( static_cast<double>( spec.cpu_quota ) ) },
            { "CpuPeriod", picojson::value( static_cast<double>( spec.cpu_period ) ) },
            { "PidsLimit", picojson::value( static_cast<double>( spec.pids_limit ) ) },
            { "NetworkMode", picojson::value( spec.network_mode ) },
            { "AutoRemove", picojson::value( spec.auto_remove ) },
        };

        picojson::object root{
            { "Image", picojson::value( spec.image ) },
            { "Cmd", picojson::value( commands ) },
            { "Env", picojson::value( envs ) },
            { "WorkingDir", picojson::value( spec.working_dir ) },
            { "Labels", picojson::value( labels ) },
            { "AttachStdin", picojson::value( false ) },
            { "AttachStdout", picojson::value( true ) },
            { "AttachStderr", picojson::value( true ) },
            { "Tty", picojson::value( false ) },
            { "OpenStdin", picojson::value( false ) },
            { "NetworkDisabled", picojson::value( spec.network_mode == "none" ) },
            { "HostConfig", picojson::value( host_config ) },
        };

        return picojson::value( root ).serialize();
    }

    auto parse_wait_response( std::string const& body )
        -> int
    {
        picojson::value v;
        auto const err = picojson::parse( v, body );
        if ( !err.empty() || !v.is<picojson::object>() ) {
            throw engine_error( "Malformed wait response: " + body );
        }

        auto const& obj = v.get<picojson::object>();

        auto const error = obj.find( "Error" );
        if ( error != obj.cend() && error->second.is<picojson::object>() ) {
            auto const message = string_member( error->second.get<picojson::object>(), "Message" );
            if ( !message.empty() ) {
                throw engine_error( "Wait for container failed: " + message );
            }
        }

        auto const status = obj.find( "StatusCode" );
        if ( status == obj.cend() || !status->second.is<double>() ) {
            throw engine_error( "Wait response has no StatusCode: " + body );
        }

        return static_cast<int>( status->second.get<double>() );
    }

    auto parse_container_list( std::string const& body )
        -> std::vector<container_summary>
    {
        picojson::value v;
        auto const err = picojson::parse( v, body );
        if ( !err.empty() || !v.is<picojson::array>() ) {
            throw engine_error( "Malformed container list: " + err );
        }

        std::vector<container_summary> summaries;
        for( auto const& item : v.get<picojson::array>() ) {
            if ( !item.is<picojson::object>() ) {
                continue;
            }
            auto const& obj = item.get<picojson::object>();

            auto summary = container_summary{
                string_member( obj, "Id" ),
                0,
                string_member( obj, "State" ),
                {}
            };

            auto const created = obj.find( "Created" );
            if ( created != obj.cend() && created->second.is<double>() ) {
                summary.created = static_cast<std::time_t>( created->second.get<double>() );
            }

            auto const labels = obj.find( "Labels" );
            if ( labels != obj.cend() && labels->second.is<picojson::object>() ) {
                for( auto const& l : labels->second.get<picojson::object>() ) {
                    if ( l.second.is<std::string>() ) {
                        summary.labels.emplace( l.first, l.second.get<std::string>() );
                    }
                }
            }

            if ( !summary.id.empty() ) {
                summaries.push_back( std::move( summary ) );
            }
        }

        return summaries;
    }


    docker_engine::docker_engine(
        fs::path socket_path,
        std::string api_version,
        boost::chrono::milliseconds const request_timeout,
        boost::chrono::milliseconds const pull_timeout
        )
        : socket_path_( std::move( socket_path ) )
        , api_version_( std::move( api_version ) )
        , request_timeout_( request_timeout )
        , pull_timeout_( pull_timeout )
    {}

    void docker_engine::ping()
    {
        auto const res = request( http::verb::get, "/_ping", "", request_timeout_ );
        if ( res.status != 200 ) {
            std::stringstream ss;
            ss << "Container engine ping failed: status=" << res.status;
            throw engine_unavailable_error( ss.str() );
        }
    }

    void docker_engine::pull_image( std::string const& reference )
    {
        auto const ref = parse_image_reference( reference );

        auto path = "/images/create?fromImage=" + url_encode( ref.name );
        if ( !ref.tag.empty() ) {
            path += "&tag=" + url_encode( ref.tag );
        }

        auto const res = request( http::verb::post, path, "", pull_timeout_ );
        if ( res.status != 200 ) {
            throw make_error( "Failed to pull " + reference, res.status, res.body );
        }

        // progress is a stream of json objects, failures are reported in band
        std::istringstream progress( res.body );
        std::string line;
        while( std::getline( progress, line ) ) {
            boost::trim( line );
            if ( line.empty() ) {
                continue;
            }

            picojson::value v;
            if ( !picojson::parse( v, line ).empty() || !v.is<picojson::object>() ) {
                continue;
            }

            auto const message = string_member( v.get<picojson::object>(), "error" );
            if ( !message.empty() ) {
                throw engine_error( "Failed to pull " + reference + " : " + message, res.status );
            }
        }
    }

    auto docker_engine::create_container( container_spec const& spec )
        -> std::string
    {
        auto const body = make_container_create_body( spec );

        auto res = request( http::verb::post, "/containers/create", body, request_timeout_ );
        if ( res.status == 404 ) {
            log_line( severity::info ) << "Image " << spec.image << " is not present, pulling";
            pull_image( spec.image );

            res = request( http::verb::post, "/containers/create", body, request_timeout_ );
        }

        if ( res.status != 201 ) {
            throw make_error( "Failed to create container from " + spec.image, res.status, res.body );
        }

        picojson::value v;
        auto const err = picojson::parse( v, res.body );
        if ( !err.empty() || !v.is<picojson::object>() ) {
            throw engine_error( "Malformed create response: " + res.body, res.status );
        }

        auto const id = string_member( v.get<picojson::object>(), "Id" );
        if ( id.empty() ) {
            throw engine_error( "Create response has no Id: " + res.body, res.status );
        }

        return id;
    }

    auto docker_engine::attach( std::string const& container_id )
        -> std::unique_ptr<output_stream>
    {
        auto conn = std::make_unique<connection>();
        connect_socket( conn->socket, socket_path_ );

        auto req = make_request(
            http::verb::post,
            target( "/containers/" + container_id + "/attach?stream=1&stdout=1&stderr=1" ),
            ""
            );
        req.set( http::field::connection, "Upgrade" );
        req.set( http::field::upgrade, "tcp" );

        http::response_parser<http::empty_body> parser;
        send_and_read_header( *conn, req, parser, request_timeout_ );

        auto const status = parser.get().result_int();
        if ( status != 101 && status != 200 ) {
            std::stringstream ss;
            ss << "Failed to attach to container " << container_id << " : status=" << status;
            throw engine_error( ss.str(), status );
        }

        return std::make_unique<docker_output_stream>( std::move( conn ) );
    }

    auto docker_engine::prepare_wait( std::string const& container_id )
        -> std::unique_ptr<exit_waiter>
    {
        auto conn = std::make_unique<connection>();
        connect_socket( conn->socket, socket_path_ );

        auto req = make_request(
            http::verb::post,
            target( "/containers/" + container_id + "/wait?condition=next-exit" ),
            ""
            );

        auto parser = std::make_unique<docker_exit_waiter::parser_type>();
        parser->body_limit( MaxResponseBodyBytes );

        // the daemon flushes the header once the wait is registered
        send_and_read_header( *conn, req, *parser, request_timeout_ );

        auto const status = parser->get().result_int();
        if ( status != 200 ) {
            beast::error_code ec;
            http::read( conn->socket, conn->buffer, *parser, ec );
            throw make_error( "Failed to wait for container " + container_id, status, parser->get().body() );
        }

        return std::make_unique<docker_exit_waiter>( std::move( conn ), std::move( parser ) );
    }

    void docker_engine::start( std::string const& container_id )
    {
        auto const res = request( http::verb::post, "/containers/" + container_id + "/start", "", request_timeout_ );

        // 304: already started
        if ( res.status != 204 && res.status != 304 ) {
            throw make_error( "Failed to start container " + container_id, res.status, res.body );
        }
    }

    auto docker_engine::kill( std::string const& container_id )
        -> bool
    {
        auto const res = request( http::verb::post, "/containers/" + container_id + "/kill", "", request_timeout_ );

        if ( res.status == 204 ) {
            return true;
        }

        // 404: no such container (auto removed), 409: not running
        if ( res.status == 404 || res.status == 409 ) {
            return false;
        }

        throw make_error( "Failed to kill container " + container_id, res.status, res.body );
    }

    void docker_engine::remove( std::string const& container_id )
    {
        auto const res = request( http::verb::delete_, "/containers/" + container_id + "?force=1", "", request_timeout_ );

        // 409: removal already in progress
        if ( res.status != 204 && res.status != 404 && res.status != 409 ) {
            throw make_error( "Failed to remove container " + container_id, res.status, res.body );
        }
    }

    auto docker_engine::list_managed()
        -> std::vector<container_summary>
    {
        picojson::object filters{
            { "label", picojson::value( picojson::array{ picojson::value( std::string( ManagedLabel ) + "=true" ) } ) },
        };
        auto const path =
            "/containers/json?all=1&filters=" + url_encode( picojson::value( filters ).serialize() );

        auto const res = request( http::verb::get, path, "", request_timeout_ );
        if ( res.status != 200 ) {
            throw make_error( "Failed to list containers", res.status, res.body );
        }

        return parse_container_list( res.body );
    }

    auto docker_engine::request(
        http::verb const verb,
        std::string const& path,
        std::string const& body,
        boost::chrono::milliseconds const timeout
        )
        -> http_response
    {
        connection conn;
        connect_socket( conn.socket, socket_path_ );

        auto req = make_request( verb, target( path ), body );

        http::response_parser<http::string_body> parser;
        parser.body_limit( MaxResponseBodyBytes );

        beast::error_code ec;
        http::async_write(
            conn.socket,
            req,
            [&]( beast::error_code const& write_ec, std::size_t ) {
                if ( write_ec ) {
                    ec = write_ec;
                    return;
                }

                http::async_read(
                    conn.socket,
                    conn.buffer,
                    parser,
                    [&]( beast::error_code const& read_ec, std::size_t ) {
                        ec = read_ec;
                    });
            });

        if ( !run_with_timeout( conn.ioc, conn.socket, timeout ) ) {
            std::stringstream ss;
            ss << "Container engine did not answer " << req.target()
               << " within " << timeout.count() << "ms";
            throw engine_unavailable_error( ss.str() );
        }

        if ( ec ) {
            std::stringstream ss;
            ss << "Engine request failed: " << req.target() << " : " << ec.message();
            throw engine_error( ss.str() );
        }

        return http_response{ parser.get().result_int(), parser.get().body() };
    }

    auto docker_engine::target( std::string const& path ) const
        -> std::string
    {
        return "/" + api_version_ + path;
    }

} // namespace kiln
