// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_RELOCATOR_HPP
# define SPLITREPO_RELOCATOR_HPP

# include "change_linkage.hpp"
# include "git_repository.hpp"
# include "history_filter.hpp"
# include "options.hpp"
# include "plan.hpp"

# include <boost/container/flat_map.hpp>
# include <boost/noncopyable.hpp>
# include <ostream>
# include <string>
# include <vector>

namespace splitrepo {

// Carries out a validated plan.  The stages must run in the order
// run() calls them; each assumes the effects of the previous ones.
struct relocator : boost::noncopyable
{
    relocator(settings const& config, plan const& moves, history_filter const& filter);

    void run(std::ostream& summary_out);

    void provision();
    void filter();
    void merge();
    void rewrite();
    void fix_metadata();
    void remove_sources();
    void summarize(std::ostream& os) const;

    // Repositories that did not exist before this run, in plan order
    std::vector<std::string> new_repositories() const;

 private: // helpers
    struct repo_state
    {
        bool is_virgin;   // no history merged into it yet
        bool is_new;      // created by this run
    };

    repo_state& state_of(std::string const& repo);
    repo_state const& state_of(std::string const& repo) const;

    void commit_metadata(filter_group const& group);
    void merge_source(destination const& dest, std::string const& source);

    // Appends "Depends-On: <id>" to HEAD of repo if the change it
    // refers to was recorded
    void depend_on(git_repository& repo, repo_pair const& repos, change_event e);

 private: // members
    settings const& config;
    plan const& moves;
    history_filter const& history;
    boost::container::flat_map<std::string, repo_state> states;
    change_linkage changes;
};

} // namespace splitrepo

#endif // SPLITREPO_RELOCATOR_HPP
