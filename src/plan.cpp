// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "plan.hpp"
#include "log.hpp"

#include <boost/filesystem/operations.hpp>
#include <algorithm>
#include <ostream>

namespace fs = boost::filesystem;

namespace splitrepo {

std::ostream& operator<<(std::ostream& os, repo_pair const& p)
{
    return os << p.source << " -> " << p.dest;
}

filter_group const* plan::find_group(repo_pair const& key) const
{
    auto p = group_index.find(key);
    return p == group_index.end() ? nullptr : &groups_[p->second];
}

destination const* plan::find_destination(std::string const& repo) const
{
    auto p = destination_index.find(repo);
    return p == destination_index.end() ? nullptr : &destinations_[p->second];
}

std::vector<std::string> plan::repositories() const
{
    std::vector<std::string> result;
    auto note = [&](std::string const& repo) {
        if (std::find(result.begin(), result.end(), repo) == result.end())
            result.push_back(repo);
    };
    for (auto const& g : groups_)
        note(g.repos.source);
    for (auto const& g : groups_)
        note(g.repos.dest);
    return result;
}

plan_builder::plan_builder(std::string os)
    : os(std::move(os))
{
}

filter_group& plan_builder::demand_group(repo_pair const& key)
{
    auto p = result.group_index.find(key);
    if (p == result.group_index.end())
    {
        p = result.group_index.emplace(key, result.groups_.size()).first;
        result.groups_.push_back(filter_group());
        result.groups_.back().repos = key;

        // The first time a pair is seen the source joins the
        // destination's merge list
        demand_destination(key.dest).sources.push_back(key.source);
    }
    return result.groups_[p->second];
}

destination& plan_builder::demand_destination(std::string const& repo)
{
    auto p = result.destination_index.find(repo);
    if (p == result.destination_index.end())
    {
        p = result.destination_index.emplace(repo, result.destinations_.size()).first;
        result.destinations_.push_back(destination());
        result.destinations_.back().repo = repo;
    }
    return result.destinations_[p->second];
}

void plan_builder::add(move_request const& r)
{
    result.requests_.push_back(r);

    filter_group& group = demand_group(repo_pair{r.source_repo, r.dest_repo});
    group.source_paths.insert(r.source_path);
    if (!r.source_path.is_root() && !r.dest_path.is_root())
        group.mappings.push_back(path_mapping{r.source_path, r.dest_path});

    add_rewrite_rules(demand_destination(r.dest_repo).rules, r);
}

// Package directories conventionally nest their descriptors under a
// directory named after the package, directly or below the
// distribution subdirectory, with a spec file named after it too.
// Those nested names follow the package's rename; each rule is
// written against the path the main rule has already produced.
void plan_builder::add_rewrite_rules(rewrite_ruleset& rules, move_request const& r) const
{
    if (r.source_path.is_root())
    {
        if (!r.dest_path.is_root())
            rules.push_back(rewrite_rule::insert(r.dest_path));
        return;
    }

    if (r.dest_path.is_root())
    {
        rules.push_back(rewrite_rule::strip(r.source_path));
        return;
    }

    rules.push_back(rewrite_rule::substitute(r.source_path, r.dest_path));

    std::string const from = r.source_path.basename();
    std::string const to = r.dest_path.basename();
    if (from == to)
        return;

    fs::path const source_dir = fs::path(r.source_repo) / r.source_path.str();

    if (fs::is_directory(source_dir / from))
    {
        rules.push_back(rewrite_rule::substitute(r.dest_path / from, r.dest_path / to));
    }

    if (fs::is_directory(source_dir / os / from))
    {
        rules.push_back(rewrite_rule::substitute(
            r.dest_path / os / from, r.dest_path / os / to));
    }

    if (fs::is_regular_file(source_dir / os / (from + ".spec")))
    {
        rules.push_back(rewrite_rule::rename_file(
            r.dest_path / os / (from + ".spec"), r.dest_path / os / (to + ".spec")));
    }
}

void print_plan(std::ostream& os, plan const& p)
{
    for (auto const& g : p.groups())
    {
        os << g.repos << "\n";
        for (auto const& source : g.source_paths)
            os << "    filter  " << source << "\n";
        for (auto const& m : g.mappings)
            os << "    map     " << m.source_path << " -> " << m.dest_path << "\n";
    }
    for (auto const& d : p.destinations())
    {
        if (d.rules.empty())
            continue;
        os << "rewrite rules for " << d.repo << "\n";
        for (auto const& r : d.rules)
            os << "    " << r << "\n";
    }
}

} // namespace splitrepo
