// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_PATH_SET_HPP
# define SPLITREPO_PATH_SET_HPP

# include "path.hpp"
# include <algorithm>
# include <initializer_list>
# include <string>
# include <vector>

namespace splitrepo {

// A sorted set of repository paths in which no element is an
// ancestor of another: inserting a directory swallows everything
// beneath it, and inserting something beneath a member is a no-op.
// This is exactly the set of prefixes handed to the history filter.
class path_set
{
    typedef std::vector<repo_path> storage;
 public:

    path_set() {}

    path_set(std::initializer_list<repo_path> const& x)
    {
        for (auto const& p : x)
            insert(p);
    }

    friend bool operator==(path_set const& lhs, path_set const& rhs)
    { return lhs.paths == rhs.paths; }

    friend bool operator!=(path_set const& lhs, path_set const& rhs)
    { return !(lhs == rhs); }

    typedef storage::value_type value_type;
    typedef storage::const_iterator const_iterator;
    typedef const_iterator iterator;

    bool empty() const { return paths.empty(); }
    std::size_t size() const { return paths.size(); }
    const_iterator begin() const { return paths.begin(); }
    const_iterator end() const { return paths.end(); }

    bool covers(repo_path const& p) const
    {
        auto pos = std::upper_bound(paths.begin(), paths.end(), p);
        return pos != paths.begin() && p.starts_with(*std::prev(pos));
    }

    void insert(repo_path p)
    {
        if (covers(p))
            return;

        auto start = std::lower_bound(paths.begin(), paths.end(), p);
        auto finish = start;
        while (finish != paths.end() && finish->starts_with(p))
            ++finish;

        start = paths.erase(start, finish);
        paths.insert(start, std::move(p));
    }

    // Space-separated, each followed by a blank; the form used in
    // commit messages.
    std::string joined() const
    {
        std::string result;
        for (auto const& p : paths)
            result += p.operand() + " ";
        return result;
    }

 private:
    storage paths;
};

} // namespace splitrepo

#endif // SPLITREPO_PATH_SET_HPP
