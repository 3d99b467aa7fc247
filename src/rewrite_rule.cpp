// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "rewrite_rule.hpp"

namespace splitrepo {

bool rewrite_rule::apply(repo_path& p) const
{
    switch (kind)
    {
    case substitute_prefix:
        if (!p.starts_with(from))
            return false;
        p = to / p.sans_prefix(from);
        return true;

    case strip_prefix:
        if (!p.starts_with(from) || from.is_root())
            return false;
        // A single file moved to the root keeps its own name
        p = p == from ? repo_path(p.basename()) : p.sans_prefix(from);
        return true;

    case insert_prefix:
        p = to / p;
        return true;

    case substitute_basename:
        if (p != from)
            return false;
        p = to;
        return true;
    }
    return false;
}

repo_path rewrite_ruleset::apply(repo_path p) const
{
    for (auto const& r : rules)
        r.apply(p);
    return p;
}

std::ostream& operator<<(std::ostream& os, rewrite_rule const& r)
{
    switch (r.kind)
    {
    case rewrite_rule::substitute_prefix:
        return os << r.from << "/ -> " << r.to << "/";
    case rewrite_rule::strip_prefix:
        return os << r.from << "/ -> ./";
    case rewrite_rule::insert_prefix:
        return os << "./ -> " << r.to << "/";
    case rewrite_rule::substitute_basename:
        return os << r.from << " -> " << r.to;
    }
    return os;
}

} // namespace splitrepo
