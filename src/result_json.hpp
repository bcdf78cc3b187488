//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <picojson.h>

#include "execution_types.hpp"
#include "package_manager.hpp"


namespace kiln
{
    class request_format_error
        : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // { success, output, errors, exitCode, duration, executionId, timedOut, error? }
    auto to_json( execution_result const& result )
        -> picojson::value;

    // { success, output, errors, duration, installedPackages, message, error? }
    auto to_json( package_install_result const& result )
        -> picojson::value;

    // { status, packages, rawOutput }
    auto to_json( package_list_result const& result )
        -> picojson::value;

    auto to_json( health_report const& report )
        -> picojson::value;

    auto to_json( std::vector<container_info> const& containers )
        -> picojson::value;

    auto to_json( std::vector<std::string> const& values )
        -> picojson::value;

    // accepts { id?, projectId, language, code?, command?, environment?, workingDir?, files? },
    // throws request_format_error
    auto parse_execution_request( std::string const& json )
        -> execution_request;

    // fd 0-2 are never closed
    auto export_json_to_fd( picojson::value const& value, int const fd )
        -> bool;

} // namespace kiln
