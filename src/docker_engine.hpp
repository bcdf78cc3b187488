//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <string>
#include <vector>

#include <boost/beast/http/verb.hpp>
#include <boost/chrono/duration.hpp>
#include <boost/filesystem/path.hpp>

#include "container_engine.hpp"


namespace kiln
{
    namespace fs = boost::filesystem;

    struct image_reference
    {
        std::string name;
        std::string tag;        // empty when the reference carries a digest
    };

    auto parse_image_reference( std::string const& reference )
        -> image_reference;

    auto url_encode( std::string const& value )
        -> std::string;

    // body of POST /containers/create
    auto make_container_create_body( container_spec const& spec )
        -> std::string;

    // body of POST /containers/{id}/wait. throws engine_error
    auto parse_wait_response( std::string const& body )
        -> int;

    // body of GET /containers/json. throws engine_error
    auto parse_container_list( std::string const& body )
        -> std::vector<container_summary>;


    //
    // Docker Engine API client over the daemon's UNIX socket.
    // A new connection is opened for every call. Calls that do not stream are
    // bounded by a timeout, attach and wait hold their connection until the container exits.
    //
    class docker_engine
        : public container_engine
    {
    public:
        docker_engine(
            fs::path socket_path,
            std::string api_version,
            boost::chrono::milliseconds const request_timeout,
            boost::chrono::milliseconds const pull_timeout
            );

        void ping() override;

        void pull_image( std::string const& reference ) override;

        auto create_container( container_spec const& spec )
            -> std::string override;

        auto attach( std::string const& container_id )
            -> std::unique_ptr<output_stream> override;

        auto prepare_wait( std::string const& container_id )
            -> std::unique_ptr<exit_waiter> override;

        void start( std::string const& container_id ) override;

        auto kill( std::string const& container_id )
            -> bool override;

        void remove( std::string const& container_id ) override;

        auto list_managed()
            -> std::vector<container_summary> override;

    private:
        struct http_response
        {
            unsigned status;
            std::string body;
        };

        auto request(
            boost::beast::http::verb const verb,
            std::string const& path,
            std::string const& body,
            boost::chrono::milliseconds const timeout
            )
            -> http_response;

        auto target( std::string const& path ) const
            -> std::string;

        fs::path socket_path_;
        std::string api_version_;
        boost::chrono::milliseconds request_timeout_;
        boost::chrono::milliseconds pull_timeout_;
    };

} // namespace kiln
