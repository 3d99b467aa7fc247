// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "commit_hook.hpp"
#include "log.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/process/search_path.hpp>

namespace fs = boost::filesystem;

namespace splitrepo {

namespace
{
  fs::path hook_of(git_repository const& repo)
  {
      return repo.git_dir() / "hooks" / "commit-msg";
  }
}

bool ensure_commit_hook(git_repository const& repo, git_repository const& donor)
{
    fs::path const hook = hook_of(repo);
    if (fs::exists(hook))
        return true;

    fs::path const git_review = boost::process::search_path("git-review");
    if (!git_review.empty())
    {
        std::string ignored;
        int status = run_capture(command(git_review, {"-s"}, repo.work_tree()), ignored);
        if (status == 0 && fs::exists(hook))
            return true;
        Log::debug() << "git review -s failed in " << repo.work_tree().generic_string()
                     << " with status " << status << std::endl;
    }

    fs::path const donor_hook = hook_of(donor);
    if (fs::exists(donor_hook) && fs::is_directory(repo.git_dir()))
    {
        Log::debug() << "copying " << donor_hook.generic_string() << " to "
                     << hook.generic_string() << std::endl;
        fs::create_directories(hook.parent_path());
        fs::copy_file(donor_hook, hook);
        fs::permissions(hook, fs::status(donor_hook).permissions());
        return true;
    }

    Log::warn() << "no commit-msg hook for " << repo.work_tree().generic_string()
                << "; its commits will carry no Change-Id" << std::endl;
    return false;
}

} // namespace splitrepo
