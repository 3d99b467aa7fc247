// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_HISTORY_REWRITER_HPP
# define SPLITREPO_HISTORY_REWRITER_HPP

# include "git_repository.hpp"
# include "rewrite_rule.hpp"
# include <istream>
# include <ostream>
# include <string>

namespace splitrepo {

// Git's C-style path quoting, as used by fast-export and accepted by
// fast-import.  unquote_path returns its argument unchanged unless it
// begins with a double quote.
std::string unquote_path(std::string const& quoted);

// Quotes p if fast-import could not read it back verbatim.
// space_terminated is for the source path of R and C commands, which
// ends at the first blank unless quoted.
std::string quote_path(std::string const& p, bool space_terminated = false);

// Copies a git fast-export stream from in to out, passing every path
// named by a file command (M, D, R, C) through rules.  Data blocks are
// copied byte for byte.
void rewrite_fast_export(std::istream& in, std::ostream& out, rewrite_ruleset const& rules);

// Rewrites every commit reachable from the current branch of repo so
// that each recorded path p becomes rules.apply(p), then updates the
// index and working tree to the new tip.
void rewrite_history(git_repository& repo, rewrite_ruleset const& rules);

} // namespace splitrepo

#endif // SPLITREPO_HISTORY_REWRITER_HPP
