//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include <boost/chrono/duration.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>


namespace kiln
{
    namespace fs = boost::filesystem;

    // a request tried to place something outside of its staging directory
    class workspace_error
        : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // [A-Za-z0-9_.-]+ except "." and ".."
    auto is_valid_project_id( std::string const& project_id )
        -> bool;

    auto project_staging_dir( fs::path const& staging_root, std::string const& project_id )
        -> fs::path;

    // resolves a request supplied relative path under `root`.
    // throws workspace_error for empty, absolute or escaping paths
    auto resolve_relative_path( fs::path const& root, std::string const& relative )
        -> fs::path;

    // throws fs::filesystem_error
    void ensure_directory( fs::path const& dir );

    // creates missing parent directories. throws fs::filesystem_error / std::runtime_error
    void write_file( fs::path const& path, std::string const& content );

    void write_project_files(
        fs::path const& staging_dir,
        std::map<std::string, std::string> const& files
        );


    // projects in use by an execution. only held projects have an entry
    class project_lock_table
    {
    public:
        project_lock_table() = default;

        project_lock_table( project_lock_table const& ) = delete;
        project_lock_table& operator=( project_lock_table const& ) = delete;

        // waits at most `timeout` until no other execution holds the project
        auto try_lock_for( std::string const& project_id, boost::chrono::milliseconds const timeout )
            -> bool;

        void unlock( std::string const& project_id ) noexcept;

        auto held_count() const
            -> std::size_t;

    private:
        mutable boost::mutex mutex_;
        boost::condition_variable released_;

        std::set<std::string> held_;
    };

    class project_lock
    {
    public:
        project_lock(
            project_lock_table& table,
            std::string const& project_id,
            boost::chrono::milliseconds const timeout
            );
        ~project_lock();

        project_lock( project_lock const& ) = delete;
        project_lock& operator=( project_lock const& ) = delete;

        explicit operator bool() const
        {
            return locked_;
        }

    private:
        project_lock_table& table_;
        std::string const project_id_;
        bool locked_;
    };

} // namespace kiln
