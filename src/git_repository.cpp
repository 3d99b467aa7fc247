// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "git_repository.hpp"
#include "git_executable.hpp"
#include "log.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/filesystem.hpp>
#include <boost/process/search_path.hpp>
#include <cstring>

namespace fs = boost::filesystem;

namespace splitrepo {

namespace
{
  std::vector<std::string> lines_of(std::string const& text)
  {
      std::vector<std::string> result;
      boost::split(result, text, boost::is_any_of("\n"));
      while (!result.empty() && result.back().empty())
          result.pop_back();
      return result;
  }
}

git_repository::git_repository(fs::path const& work_tree)
    : dir(work_tree)
{
}

git_repository git_repository::init(fs::path const& work_tree)
{
    fs::create_directories(work_tree);
    git_repository repo(work_tree);
    repo.git_run({"init", "--quiet"});
    return repo;
}

fs::path git_repository::git_dir() const
{
    return dir / ".git";
}

command git_repository::git(std::vector<std::string> args) const
{
    return command(git_executable(), std::move(args), dir);
}

std::string git_repository::git_output(std::vector<std::string> args) const
{
    return capture(git(std::move(args)));
}

void git_repository::git_run(std::vector<std::string> args) const
{
    run(git(std::move(args)));
}

bool git_repository::exists() const
{
    return fs::is_directory(dir);
}

bool git_repository::has_commits() const
{
    std::string ignored;
    return run_capture(git({"rev-parse", "--verify", "-q", "HEAD"}).silence(), ignored) == 0;
}

std::string git_repository::current_branch() const
{
    std::string output;
    if (run_capture(git({"symbolic-ref", "--short", "-q", "HEAD"}).silence(), output) != 0)
        return std::string();
    boost::trim(output);
    return output;
}

bool git_repository::has_branch(std::string const& name) const
{
    std::string ignored;
    return run_capture(
        git({"show-ref", "--verify", "-q", "refs/heads/" + name}).silence(), ignored) == 0;
}

void git_repository::switch_to_branch(std::string const& name)
{
    if (current_branch() == name)
        return;

    Log::info() << "switching " << dir.generic_string() << " to branch " << name << std::endl;
    if (is_repo_controlled())
        run(command(boost::process::search_path("repo"), {"start", "--head", name}, dir));
    else if (has_branch(name))
        git_run({"checkout", "-q", name});
    else
        git_run({"checkout", "-q", "-b", name});
}

void git_repository::rename_current_branch(std::string const& name)
{
    if (current_branch() == name)
        return;
    git_run({"branch", "-m", name});
}

bool git_repository::has_staged_changes() const
{
    return !git_output({"diff", "--cached", "--name-only"}).empty();
}

void git_repository::add(std::string const& path)
{
    git_run({"add", "--", path});
}

void git_repository::remove_recursive(std::string const& path)
{
    git_run({"rm", "-r", "-f", "-q", "--", path});
}

void git_repository::commit(std::string const& message)
{
    git_run({"commit", "-q", "-s", "-m", message});
}

void git_repository::amend_signoff()
{
    git_run({"commit", "-q", "--amend", "--no-edit", "-s"});
}

std::string git_repository::head_message() const
{
    return git_output({"log", "-1", "--pretty=%B"});
}

void git_repository::append_to_head_message(std::string const& line)
{
    std::string message = head_message();
    boost::trim_right(message);
    message += "\n" + line + "\n";
    run_with_input(git({"commit", "-q", "--amend", "-F", "-"}), message);
}

std::string git_repository::head_change_id() const
{
    // A merge may list its parents' ids too; the merge's own comes first
    for (auto const& line : lines_of(head_message()))
    {
        if (boost::starts_with(line, "Change-Id:"))
            return boost::trim_copy(line.substr(std::strlen("Change-Id:")));
    }
    return std::string();
}

void git_repository::add_remote(std::string const& name, std::string const& url)
{
    git_run({"remote", "add", name, url});
}

void git_repository::fetch(std::string const& remote)
{
    git_run({"fetch", "-q", remote});
}

void git_repository::remove_remote(std::string const& name)
{
    git_run({"remote", "remove", name});
}

void git_repository::merge(
    std::string const& from, std::string const& message,
    std::vector<std::string> const& extra_args)
{
    std::vector<std::string> args = {"merge", "-q", "-m", message};
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    args.push_back(from);
    git_run(args);
}

void git_repository::reset_hard()
{
    git_run({"reset", "--hard", "-q"});
}

std::vector<std::string> git_repository::list_refs(std::string const& pattern) const
{
    return lines_of(git_output({"for-each-ref", "--format=%(refname)", pattern}));
}

void git_repository::drop_backup_refs()
{
    for (auto const& ref : list_refs("refs/original/"))
    {
        Log::debug() << "dropping stale backup ref " << ref << std::endl;
        git_run({"update-ref", "-d", ref});
    }
}

// A repository is under "repo" control when it sits below a .repo
// directory and the manifest lists its Git root as a project.
bool git_repository::is_repo_controlled() const
{
    fs::path const repo_root = find_enclosing(dir, ".repo");
    if (repo_root.empty())
        return false;
    fs::path const git_root = find_enclosing(dir, ".git");
    if (git_root.empty())
        return false;
    fs::path const repo_exe = boost::process::search_path("repo");
    if (repo_exe.empty())
        return false;

    std::string const relative = fs::relative(git_root, repo_root).generic_string();
    std::string output;
    if (run_capture(command(repo_exe, {"forall", "-c", "echo $REPO_PATH"}, repo_root).silence(),
                    output) != 0)
        return false;
    for (auto const& project : lines_of(output))
    {
        if (project == relative)
            return true;
    }
    return false;
}

fs::path find_enclosing(fs::path const& start, std::string const& marker)
{
    boost::system::error_code ec;
    fs::path d = fs::canonical(start, ec);
    if (ec)
        return fs::path();
    while (d.has_parent_path() && d != d.root_path())
    {
        if (fs::exists(d / marker))
            return d;
        d = d.parent_path();
    }
    return fs::path();
}

} // namespace splitrepo
