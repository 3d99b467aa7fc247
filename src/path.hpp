// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_PATH_HPP
# define SPLITREPO_PATH_HPP

# include <boost/algorithm/string/trim.hpp>
# include <boost/algorithm/string/predicate.hpp>
# include <boost/algorithm/string/classification.hpp>
# include <boost/operators.hpp>
# include <cassert>
# include <string>
# include <ostream>

namespace splitrepo {

// A repository-relative path as it appears in a map file or in the
// index of a Git commit.  Boost.Filesystem's path is inappropriate
// here: these paths always use '/' and never touch the disk.
//
// We normalize by stripping leading and trailing slashes.  The
// repository root, spelled "." in map files, is the empty path.
struct repo_path : boost::totally_ordered<repo_path>
{
    repo_path() {}

    repo_path(char const* x)
        : text(normalize(std::string(x)))
    {}

    repo_path(std::string x)
        : text(normalize(std::move(x)))
    {}

    bool is_root() const { return text.empty(); }

    // True iff prefix names this path or one of its ancestors.  The
    // root is everybody's ancestor.
    bool starts_with(repo_path const& prefix) const
    {
        return prefix.is_root() || (
            boost::starts_with(text, prefix.text) && (
                text.size() == prefix.text.size()
                || text[prefix.text.size()] == '/'));
    }

    // The remainder of this path below prefix, without a leading slash
    repo_path sans_prefix(repo_path const& prefix) const
    {
        assert(starts_with(prefix));
        return repo_path(text.substr(prefix.text.size()));
    }

    std::string basename() const
    {
        std::string::size_type slash = text.rfind('/');
        return slash == std::string::npos ? text : text.substr(slash + 1);
    }

    // The spelling to hand to git or write into a map file
    std::string operand() const
    {
        return is_root() ? std::string(".") : text;
    }

    std::string const& str() const
    {
        return text;
    }

    friend bool operator==(repo_path const& p0, repo_path const& p1)
    {
        return p0.text == p1.text;
    }

    // Component-wise ordering: '/' sorts before every other
    // character, so a directory is immediately followed by its
    // descendants ("a" < "a/b" < "a.txt").
    friend bool operator<(repo_path const& p0, repo_path const& p1)
    {
        std::string const& a = p0.text;
        std::string const& b = p1.text;
        std::size_t n = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < n; ++i)
        {
            if (a[i] == b[i])
                continue;
            if (a[i] == '/')
                return true;
            if (b[i] == '/')
                return false;
            return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[i]);
        }
        return a.size() < b.size();
    }

    friend std::ostream& operator<<(std::ostream& os, repo_path const& p)
    {
        return os << p.operand();
    }

    friend repo_path operator/(repo_path lhs, repo_path const& rhs)
    {
        if (!lhs.text.empty() && !rhs.text.empty())
            lhs.text.push_back('/');
        lhs.text += rhs.text;
        return lhs;
    }

 private:
    static std::string normalize(std::string x)
    {
        boost::algorithm::trim_if(x, boost::is_any_of("/"));
        while (boost::starts_with(x, "./"))
            x.erase(0, 2);
        if (x == ".")
            x.clear();
        return x;
    }

 private:
    std::string text;
};

} // namespace splitrepo

#endif // SPLITREPO_PATH_HPP
