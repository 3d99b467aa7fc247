// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_REWRITE_RULE_HPP
# define SPLITREPO_REWRITE_RULE_HPP

# include "path.hpp"
# include <ostream>
# include <vector>

namespace splitrepo {

// One path substitution applied to every file recorded in the
// rewritten history.
struct rewrite_rule
{
    enum kind_t
    {
        substitute_prefix,   // from[/rest]  -> to[/rest]
        strip_prefix,        // from/rest    -> rest
        insert_prefix,       // anything     -> to/anything
        substitute_basename  // exactly from -> to
    };

    static rewrite_rule substitute(repo_path from, repo_path to)
    { return rewrite_rule(substitute_prefix, std::move(from), std::move(to)); }

    static rewrite_rule strip(repo_path from)
    { return rewrite_rule(strip_prefix, std::move(from), repo_path()); }

    static rewrite_rule insert(repo_path to)
    { return rewrite_rule(insert_prefix, repo_path(), std::move(to)); }

    static rewrite_rule rename_file(repo_path from, repo_path to)
    { return rewrite_rule(substitute_basename, std::move(from), std::move(to)); }

    // Rewrites p in place; returns false (leaving p alone) if the rule
    // does not apply.
    bool apply(repo_path& p) const;

    friend bool operator==(rewrite_rule const& lhs, rewrite_rule const& rhs)
    {
        return lhs.kind == rhs.kind && lhs.from == rhs.from && lhs.to == rhs.to;
    }

    friend bool operator!=(rewrite_rule const& lhs, rewrite_rule const& rhs)
    {
        return !(lhs == rhs);
    }

    kind_t kind;
    repo_path from;
    repo_path to;

 private:
    rewrite_rule(kind_t kind, repo_path from, repo_path to)
        : kind(kind), from(std::move(from)), to(std::move(to))
    {}
};

std::ostream& operator<<(std::ostream& os, rewrite_rule const& r);

// The ordered rules for one destination repository.  Every rule is
// offered every path in turn, so a later rule sees the result of the
// earlier ones; more specific rules are written after the rule that
// moves their parent.
class rewrite_ruleset
{
    typedef std::vector<rewrite_rule> storage;
 public:
    typedef storage::const_iterator const_iterator;

    void push_back(rewrite_rule r) { rules.push_back(std::move(r)); }

    bool empty() const { return rules.empty(); }
    std::size_t size() const { return rules.size(); }
    const_iterator begin() const { return rules.begin(); }
    const_iterator end() const { return rules.end(); }
    rewrite_rule const& operator[](std::size_t i) const { return rules[i]; }

    repo_path apply(repo_path p) const;

 private:
    storage rules;
};

} // namespace splitrepo

#endif // SPLITREPO_REWRITE_RULE_HPP
