//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "container_engine.hpp"

#include <boost/algorithm/string.hpp>


namespace kiln
{
    std::ostream& operator<<( std::ostream& os, container_spec const& spec )
    {
        os << "container_spec" << std::endl
           << "  image      : " << spec.image << std::endl
           << "  working_dir: " << spec.working_dir << std::endl
           << "  mount      : " << spec.mount.host_path << " -> " << spec.mount.guest_path
           << ( spec.mount.is_readonly ? " (ro)" : " (rw)" ) << std::endl
           << "  memory     : " << spec.memory_bytes << std::endl
           << "  cpu        : " << spec.cpu_quota << " / " << spec.cpu_period << std::endl
           << "  pids       : " << spec.pids_limit << std::endl
           << "  network    : " << spec.network_mode << std::endl
           << "  auto_remove: " << spec.auto_remove << std::endl
            ;

        os << "  commands: " << std::endl
           << "    " << boost::algorithm::join( spec.commands, ", " ) << std::endl;

        // values may be secrets, names only
        os << "  envs: " << std::endl;
        for( auto&& env : spec.envs ) {
            os << "    " << env.substr( 0, env.find( '=' ) ) << std::endl;
        }

        return os;
    }

} // namespace kiln
