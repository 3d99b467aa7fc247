// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "validate_plan.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <boost/filesystem/operations.hpp>

namespace fs = boost::filesystem;

namespace splitrepo {

void validate_plan(plan const& p)
{
    for (auto const& group : p.groups())
    {
        fs::path const source_repo(group.repos.source);
        if (!fs::is_directory(source_repo))
        {
            throw precondition_error(
                "directory not found, src_repo='" + group.repos.source + "'");
        }

        // Every row is checked, including those whose path the
        // group's path_set subsumed under a parent
        for (auto const& request : p.requests())
        {
            if (repo_pair{request.source_repo, request.dest_repo} != group.repos)
                continue;
            fs::path const on_disk = source_repo / request.source_path.str();
            if (!fs::is_directory(on_disk) && !fs::is_regular_file(on_disk))
            {
                throw precondition_error(
                    "path not found, src_path='" + request.source_path.operand()
                    + "' within src_repo='" + group.repos.source + "'");
            }
        }
        Log::debug() << "validated " << group.repos << std::endl;
    }
}

} // namespace splitrepo
