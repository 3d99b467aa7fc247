// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_GIT_REPOSITORY_HPP
# define SPLITREPO_GIT_REPOSITORY_HPP

# include "process.hpp"
# include <boost/filesystem/path.hpp>
# include <string>
# include <vector>

namespace splitrepo {

// A non-bare Git working tree on disk, driven entirely through the
// git command line.
struct git_repository
{
    explicit git_repository(boost::filesystem::path const& work_tree);

    // Creates the directory if needed and runs "git init" in it.
    static git_repository init(boost::filesystem::path const& work_tree);

    boost::filesystem::path const& work_tree() const { return dir; }
    boost::filesystem::path git_dir() const;

    bool exists() const;
    bool has_commits() const;

    // Empty while HEAD points at an unborn branch or is detached
    std::string current_branch() const;
    bool has_branch(std::string const& name) const;

    // Makes name the current branch, creating it at HEAD if needed.
    // Repositories managed by the "repo" tool get "repo start --head".
    void switch_to_branch(std::string const& name);
    void rename_current_branch(std::string const& name);

    bool has_staged_changes() const;
    void add(std::string const& path);
    void remove_recursive(std::string const& path);
    void commit(std::string const& message);
    void amend_signoff();

    // Appends a line to the HEAD commit message, after stripping
    // trailing blank lines.
    void append_to_head_message(std::string const& line);
    std::string head_message() const;

    // The first Change-Id trailer of the HEAD commit, or empty
    std::string head_change_id() const;

    void add_remote(std::string const& name, std::string const& url);
    void fetch(std::string const& remote);
    void remove_remote(std::string const& name);
    void merge(std::string const& from, std::string const& message,
               std::vector<std::string> const& extra_args);

    void reset_hard();

    // Deletes refs/original/*, left behind by earlier filter runs
    void drop_backup_refs();

    std::vector<std::string> list_refs(std::string const& pattern) const;

    // Low level access for callers that need other commands
    command git(std::vector<std::string> args) const;
    std::string git_output(std::vector<std::string> args) const;
    void git_run(std::vector<std::string> args) const;

 private:
    bool is_repo_controlled() const;

 private: // data members
    // Relative path to the working tree from the current working
    // directory, as spelled in the map file
    boost::filesystem::path dir;
};

// Walks up from start looking for a directory containing marker;
// returns the empty path when there is none.
boost::filesystem::path find_enclosing(
    boost::filesystem::path const& start, std::string const& marker);

} // namespace splitrepo

#endif // SPLITREPO_GIT_REPOSITORY_HPP
