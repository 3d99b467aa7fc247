// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_COMMIT_HOOK_HPP
# define SPLITREPO_COMMIT_HOOK_HPP

# include "git_repository.hpp"

namespace splitrepo {

// Makes sure repo has Gerrit's commit-msg hook, so that its commits
// carry a Change-Id.  Runs "git review -s" when git-review is
// installed, otherwise copies the hook of donor.  Returns false, after
// a warning, when no hook could be installed.
bool ensure_commit_hook(git_repository const& repo, git_repository const& donor);

} // namespace splitrepo

#endif // SPLITREPO_COMMIT_HOOK_HPP
