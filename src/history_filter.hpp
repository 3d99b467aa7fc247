// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_HISTORY_FILTER_HPP
# define SPLITREPO_HISTORY_FILTER_HPP

# include "path_set.hpp"
# include <boost/filesystem/path.hpp>
# include <string>

namespace splitrepo {

// Destructively rewrites the repository checked out at work_tree so
// that only history touching the given prefixes remains.
struct history_filter
{
    virtual ~history_filter() {}
    virtual void filter(boost::filesystem::path const& work_tree, path_set const& keep) const = 0;
};

// oslo.tools' filter_git_history.sh, invoked as
// "filter_git_history.sh ^prefix1 ^prefix2 ..."
class oslo_history_filter : public history_filter
{
 public:
    explicit oslo_history_filter(boost::filesystem::path tool)
        : tool(std::move(tool))
    {}

    void filter(boost::filesystem::path const& work_tree, path_set const& keep) const;

    boost::filesystem::path const& executable() const { return tool; }

 private:
    boost::filesystem::path tool;
};

extern char const filter_script_name[];

// Looks for the filter script in $OSLO_TOOLS, then on the search
// path; throws configuration_error with instructions if neither has it.
boost::filesystem::path locate_filter_tool();

// Flattens source_repo into a single path component that is also a
// valid remote name.  Characters other than letters, digits, '-' and
// '_' become %XX, so distinct repositories never share a name.
std::string escape_repo_name(std::string const& source_repo);

// Name, below a destination, of the scratch copy for source_repo
std::string scratch_name(std::string const& source_repo);

// Name of the temporary remote through which the scratch copy of
// source_repo is fetched
std::string scratch_remote_name(std::string const& source_repo);

// Produces the filtered scratch copy of source_repo under dest_repo,
// unless a previous run already left one there; returns false in that
// case.  The copy is checked out on branch before filtering.
bool stage_filtered_copy(
    history_filter const& filter,
    std::string const& source_repo,
    std::string const& dest_repo,
    path_set const& keep,
    std::string const& branch);

} // namespace splitrepo

#endif // SPLITREPO_HISTORY_FILTER_HPP
