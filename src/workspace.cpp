//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "workspace.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/thread/locks.hpp>

#include <errno.h>
#include <cstring>


namespace kiln
{
    auto is_valid_project_id( std::string const& project_id )
        -> bool
    {
        if ( project_id.empty() || project_id == "." || project_id == ".." ) {
            return false;
        }

        return std::all_of( project_id.cbegin(), project_id.cend(), []( char const c ) {
                return std::isalnum( static_cast<unsigned char>( c ) ) || c == '_' || c == '.' || c == '-';
            });
    }

    auto project_staging_dir( fs::path const& staging_root, std::string const& project_id )
        -> fs::path
    {
        if ( !is_valid_project_id( project_id ) ) {
            throw workspace_error( "Invalid project id: \"" + project_id + "\"" );
        }

        return staging_root / project_id;
    }

    auto resolve_relative_path( fs::path const& root, std::string const& relative )
        -> fs::path
    {
        auto const rel = fs::path( relative );
        if ( relative.empty() || rel.has_root_path() ) {
            throw workspace_error( "File path must be relative: \"" + relative + "\"" );
        }

        auto resolved = root;
        for( auto const& part : rel ) {
            if ( part == ".." ) {
                throw workspace_error( "File path escapes the workspace: \"" + relative + "\"" );
            }
            if ( part == "." || part.empty() ) {
                continue;
            }

            resolved /= part;
        }

        if ( resolved == root ) {
            throw workspace_error( "File path names the workspace itself: \"" + relative + "\"" );
        }

        return resolved;
    }

    void ensure_directory( fs::path const& dir )
    {
        fs::create_directories( dir );    // throw exception if failed
    }

    void write_file( fs::path const& path, std::string const& content )
    {
        ensure_directory( path.parent_path() );

        fs::ofstream ofs( path, std::ios::binary | std::ios::trunc );
        if ( !ofs ) {
            std::stringstream ss;
            ss << "Failed to open " << path
               << " errno=" << errno << " : " << std::strerror( errno );
            throw std::runtime_error( ss.str() );
        }

        ofs.write( content.data(), static_cast<std::streamsize>( content.size() ) );
        if ( !ofs ) {
            std::stringstream ss;
            ss << "Failed to write " << path
               << " errno=" << errno << " : " << std::strerror( errno );
            throw std::runtime_error( ss.str() );
        }
    }

    void write_project_files(
        fs::path const& staging_dir,
        std::map<std::string, std::string> const& files
        )
    {
        // resolve everything first, nothing is written for a request with a bad path
        std::vector<std::pair<fs::path, std::string const*>> resolved;
        for( auto const& f : files ) {
            resolved.emplace_back( resolve_relative_path( staging_dir, f.first ), &f.second );
        }

        for( auto const& r : resolved ) {
            write_file( r.first, *r.second );
        }
    }


    auto project_lock_table::try_lock_for(
        std::string const& project_id,
        boost::chrono::milliseconds const timeout
        )
        -> bool
    {
        boost::unique_lock<boost::mutex> lock( mutex_ );

        auto const is_free = [&] { return held_.count( project_id ) == 0; };
        if ( !released_.wait_for( lock, timeout, is_free ) ) {
            return false;
        }

        held_.insert( project_id );
        return true;
    }

    void project_lock_table::unlock( std::string const& project_id ) noexcept
    {
        {
            boost::lock_guard<boost::mutex> lock( mutex_ );
            held_.erase( project_id );
        }
        // waiters of other projects share the condition
        released_.notify_all();
    }

    auto project_lock_table::held_count() const
        -> std::size_t
    {
        boost::lock_guard<boost::mutex> lock( mutex_ );
        return held_.size();
    }


    project_lock::project_lock(
        project_lock_table& table,
        std::string const& project_id,
        boost::chrono::milliseconds const timeout
        )
        : table_( table )
        , project_id_( project_id )
        , locked_( table.try_lock_for( project_id, timeout ) )
    {}

    project_lock::~project_lock()
    {
        if ( locked_ ) {
            table_.unlock( project_id_ );
        }
    }

} // namespace kiln
