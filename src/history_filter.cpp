// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "history_filter.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "git_repository.hpp"
#include "log.hpp"
#include "process.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/process/search_path.hpp>
#include <cctype>
#include <cstdlib>

namespace fs = boost::filesystem;

namespace splitrepo {

char const filter_script_name[] = "filter_git_history.sh";

namespace
{
  bool is_executable(fs::path const& p)
  {
      boost::system::error_code ec;
      fs::file_status const s = fs::status(p, ec);
      return !ec && fs::is_regular_file(s)
          && (s.permissions() & (fs::owner_exe | fs::group_exe | fs::others_exe)) != 0;
  }
}

void oslo_history_filter::filter(fs::path const& work_tree, path_set const& keep) const
{
    std::vector<std::string> args;
    for (auto const& p : keep)
        args.push_back("^" + p.operand());

    Log::info() << "filtering " << work_tree.generic_string()
                << " down to " << keep.joined() << std::endl;
    run(command(tool, args, work_tree));
}

fs::path locate_filter_tool()
{
    if (char const* oslo_tools = std::getenv("OSLO_TOOLS"))
    {
        fs::path const candidate = fs::path(oslo_tools) / filter_script_name;
        if (fs::is_directory(oslo_tools) && is_executable(candidate))
            return candidate;
    }

    fs::path const found = boost::process::search_path(filter_script_name);
    if (!found.empty())
        return found;

    throw configuration_error(
        std::string(filter_script_name) + " is not found.  "
        "You need to get it and set OSLO_TOOLS to the directory:\n"
        "    $ git clone https://opendev.org/openstack/oslo.tools.git oslo.tools\n"
        "    $ export OSLO_TOOLS=$(pwd)/oslo.tools");
}

std::string escape_repo_name(std::string const& source_repo)
{
    static char const hex[] = "0123456789ABCDEF";
    std::string name;
    for (char c : source_repo)
    {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')
        {
            name += c;
        }
        else
        {
            unsigned char const u = static_cast<unsigned char>(c);
            name += '%';
            name += hex[u >> 4];
            name += hex[u & 0xf];
        }
    }
    return name;
}

std::string scratch_name(std::string const& source_repo)
{
    return escape_repo_name(source_repo) + ".old_repo";
}

std::string scratch_remote_name(std::string const& source_repo)
{
    return "tmp-" + escape_repo_name(source_repo);
}

bool stage_filtered_copy(
    history_filter const& filter,
    std::string const& source_repo,
    std::string const& dest_repo,
    path_set const& keep,
    std::string const& branch)
{
    fs::path const work_dir = fs::path(dest_repo) / scratch_name(source_repo);
    if (fs::exists(work_dir))
    {
        Log::info() << "reusing filtered copy " << work_dir.generic_string()
                    << " from an earlier run" << std::endl;
        return false;
    }

    // The filter is destructive, so it only ever sees a copy
    Log::info() << "copying " << source_repo << " to " << work_dir.generic_string() << std::endl;
    copy_tree(source_repo, work_dir);

    git_repository scratch(work_dir);
    scratch.drop_backup_refs();
    scratch.switch_to_branch(branch);
    filter.filter(work_dir, keep);
    return true;
}

} // namespace splitrepo
