// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_CHANGE_LINKAGE_HPP
# define SPLITREPO_CHANGE_LINKAGE_HPP

# include "plan.hpp"
# include <boost/filesystem/path.hpp>
# include <boost/noncopyable.hpp>
# include <fstream>
# include <string>
# include <vector>

namespace splitrepo {

// The commits that make up one move, in the order they are made
enum class change_event
{
    merge,         // history merged into the destination
    from_config,   // metadata edits in the source
    to_config,     // metadata edits in the destination
    removal        // moved paths deleted from the source
};

char const* to_string(change_event e);

// Append-only record of the Gerrit Change-Ids of the commits made by
// this run, so later commits can declare "Depends-On:" the earlier
// side of the same move.  Entries are mirrored to a temporary file
// which is removed when the linkage is destroyed.
class change_linkage : boost::noncopyable
{
 public:
    change_linkage();
    ~change_linkage();

    // Empty change ids are not recorded
    void record(repo_pair const& repos, change_event e, std::string const& change_id);

    // The most recently recorded id, or empty
    std::string lookup(repo_pair const& repos, change_event e) const;

    boost::filesystem::path const& file() const { return file_name; }

 private:
    struct entry
    {
        repo_pair repos;
        change_event event;
        std::string change_id;
    };

    std::vector<entry> entries;
    boost::filesystem::path file_name;
    std::ofstream log;
};

} // namespace splitrepo

#endif // SPLITREPO_CHANGE_LINKAGE_HPP
