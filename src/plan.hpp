// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_PLAN_HPP
# define SPLITREPO_PLAN_HPP

# include "path.hpp"
# include "path_set.hpp"
# include "rewrite_rule.hpp"
# include <boost/container/flat_map.hpp>
# include <string>
# include <tuple>
# include <vector>

namespace splitrepo {

// One row of the map file
struct move_request
{
    std::string source_repo;
    repo_path source_path;
    std::string dest_repo;
    repo_path dest_path;
    std::size_t line;
};

// A (source repository, destination repository) pair; everything
// that is filtered and merged exactly once is keyed by this.
struct repo_pair
{
    std::string source;
    std::string dest;

    friend bool operator==(repo_pair const& lhs, repo_pair const& rhs)
    {
        return lhs.source == rhs.source && lhs.dest == rhs.dest;
    }

    friend bool operator!=(repo_pair const& lhs, repo_pair const& rhs)
    {
        return !(lhs == rhs);
    }

    friend bool operator<(repo_pair const& lhs, repo_pair const& rhs)
    {
        return std::tie(lhs.source, lhs.dest) < std::tie(rhs.source, rhs.dest);
    }
};

std::ostream& operator<<(std::ostream& os, repo_pair const& p);

// A component whose on-disk name may change with the move
struct path_mapping
{
    repo_path source_path;
    repo_path dest_path;

    std::string from_name() const { return source_path.basename(); }
    std::string to_name() const { return dest_path.basename(); }
    bool renamed() const { return from_name() != to_name(); }
};

struct filter_group
{
    repo_pair repos;
    path_set source_paths;
    std::vector<path_mapping> mappings;   // in map file order
};

struct destination
{
    std::string repo;
    std::vector<std::string> sources;     // in order of first appearance
    rewrite_ruleset rules;
};

// Everything the map file says, organized for the pipeline stages.
// Built once by plan_builder and read-only afterwards.
class plan
{
 public:
    std::vector<move_request> const& requests() const { return requests_; }
    std::vector<filter_group> const& groups() const { return groups_; }
    std::vector<destination> const& destinations() const { return destinations_; }

    bool empty() const { return requests_.empty(); }

    filter_group const* find_group(repo_pair const& key) const;
    destination const* find_destination(std::string const& repo) const;

    // Every repository the plan mentions, sources first
    std::vector<std::string> repositories() const;

 private:
    friend class plan_builder;

    std::vector<move_request> requests_;
    std::vector<filter_group> groups_;
    std::vector<destination> destinations_;
    boost::container::flat_map<repo_pair, std::size_t> group_index;
    boost::container::flat_map<std::string, std::size_t> destination_index;
};

class plan_builder
{
 public:
    // os names the per-distribution subdirectory ("centos") searched
    // for self-named package directories and spec files.
    explicit plan_builder(std::string os);

    void add(move_request const& request);

    plan build() { return std::move(result); }

 private:
    filter_group& demand_group(repo_pair const& key);
    destination& demand_destination(std::string const& repo);
    void add_rewrite_rules(rewrite_ruleset& rules, move_request const& r) const;

 private:
    std::string os;
    plan result;
};

void print_plan(std::ostream& os, plan const& p);

} // namespace splitrepo

#endif // SPLITREPO_PLAN_HPP
