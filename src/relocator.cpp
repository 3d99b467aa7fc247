// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "relocator.hpp"
#include "commit_hook.hpp"
#include "errors.hpp"
#include "history_rewriter.hpp"
#include "log.hpp"
#include "metadata_fixers.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/operations.hpp>

namespace fs = boost::filesystem;

namespace splitrepo {

namespace
{
  std::string repo_basename(std::string const& repo)
  {
      return fs::path(boost::trim_right_copy_if(repo, [](char c) { return c == '/'; }))
          .filename().string();
  }

  // Each path followed by a blank, the way commit messages list them
  std::string list_paths(std::vector<path_mapping> const& mappings, bool sources)
  {
      std::string result;
      for (auto const& m : mappings)
          result += (sources ? m.source_path : m.dest_path).operand() + " ";
      return result;
  }
}

relocator::relocator(settings const& config, plan const& moves, history_filter const& filter)
    : config(config), moves(moves), history(filter)
{
    // Decided before anything is created
    for (auto const& repo : moves.repositories())
    {
        bool const missing = !fs::is_directory(repo);
        repo_state s = { missing, missing };
        states.emplace(repo, s);
    }
}

relocator::repo_state& relocator::state_of(std::string const& repo)
{
    auto p = states.find(repo);
    if (p == states.end())
        throw internal_error("repository '" + repo + "' is not part of the plan");
    return p->second;
}

relocator::repo_state const& relocator::state_of(std::string const& repo) const
{
    auto p = states.find(repo);
    if (p == states.end())
        throw internal_error("repository '" + repo + "' is not part of the plan");
    return p->second;
}

void relocator::run(std::ostream& summary_out)
{
    provision();
    filter();
    merge();
    rewrite();
    fix_metadata();
    remove_sources();
    summarize(summary_out);
}

void relocator::provision()
{
    Log::set_stage("provisioning destinations");
    for (auto const& g : moves.groups())
    {
        if (g.repos.source == g.repos.dest)
            continue;

        git_repository dest(g.repos.dest);
        if (!dest.exists())
        {
            Log::info() << "creating destination repo '" << g.repos.dest << "'" << std::endl;
            git_repository::init(g.repos.dest);
        }
        else if (!state_of(g.repos.dest).is_virgin && dest.has_commits())
        {
            dest.switch_to_branch(config.modified_branch);
        }
    }
}

void relocator::filter()
{
    Log::set_stage("filtering history");
    for (auto const& g : moves.groups())
    {
        if (g.repos.source == g.repos.dest)
            continue;

        Log::info() << "processing moves from '" << g.repos.source
                    << "' to '" << g.repos.dest << "'" << std::endl;
        stage_filtered_copy(history, g.repos.source, g.repos.dest,
                            g.source_paths, config.modified_branch);
    }
}

void relocator::merge()
{
    Log::set_stage("merging");
    for (auto const& d : moves.destinations())
    {
        for (auto const& source : d.sources)
        {
            if (source != d.repo)
                merge_source(d, source);
        }
    }
}

void relocator::merge_source(destination const& d, std::string const& source)
{
    repo_pair const repos = { source, d.repo };
    std::string const scratch = scratch_name(source);
    fs::path const work_dir = fs::path(d.repo) / scratch;
    if (!fs::is_directory(work_dir))
        throw internal_error("missing directory '" + work_dir.generic_string() + "'");

    git_repository dest(d.repo);
    std::string const remote = scratch_remote_name(source);
    dest.add_remote(remote, scratch);
    dest.fetch(remote);
    ensure_commit_hook(dest, git_repository(source));

    std::vector<std::string> extra_args;
    repo_state& state = state_of(d.repo);
    if (state.is_virgin)
    {
        // Nothing to reconcile with; the incoming history is adopted
        extra_args = {"-s", "ours"};
        state.is_virgin = false;
    }
    else
    {
        extra_args = {"--allow-unrelated-histories"};
    }

    Log::info() << "merging " << source << " into " << d.repo << std::endl;
    dest.merge(remote + "/" + config.modified_branch,
               "Merge select content originating from repo '" + source + "'",
               extra_args);
    dest.amend_signoff();
    changes.record(repos, change_event::merge, dest.head_change_id());

    dest.remove_remote(remote);
    fs::remove_all(work_dir);
}

void relocator::rewrite()
{
    Log::set_stage("rewriting paths");
    for (auto const& d : moves.destinations())
    {
        if (d.rules.empty())
            continue;
        if (!fs::is_directory(d.repo))
            throw internal_error("directory not found, dest_repo='" + d.repo + "'");

        Log::info() << "processing renames within '" << d.repo << "'" << std::endl;
        git_repository repo(d.repo);
        rewrite_history(repo, d.rules);

        if (state_of(d.repo).is_new)
            repo.rename_current_branch(config.new_branch);
    }
}

void relocator::fix_metadata()
{
    Log::set_stage("fixing metadata");
    for (auto const& g : moves.groups())
    {
        if (g.mappings.empty())
            continue;

        fixer_context ctx = { config, moves, g, state_of(g.repos.dest).is_new, subpackage_map() };
        fix_branches(ctx);
        ctx.subpackages = declared_subpackages(ctx);
        fix_package_dirs(ctx);
        fix_wheels_lists(ctx);
        fix_image_lists(ctx);
        fix_pkg_info(ctx);
        fix_specs(ctx);
        fix_build_srpm_data(ctx);
        commit_metadata(g);
        fix_dependent_specs(ctx, changes);
    }
}

void relocator::commit_metadata(filter_group const& g)
{
    git_repository source(g.repos.source);
    git_repository dest(g.repos.dest);

    if (source.has_staged_changes())
    {
        ensure_commit_hook(source, dest);
        source.commit("Config file changes to remove '" + list_paths(g.mappings, true)
                      + "' after relocation to '" + g.repos.dest + "'");
        changes.record(g.repos, change_event::from_config, source.head_change_id());
    }

    if (dest.has_staged_changes())
    {
        ensure_commit_hook(dest, source);
        dest.commit("Config file changes to add '" + list_paths(g.mappings, false)
                    + "' after relocation from '" + g.repos.source + "'");
        depend_on(dest, g.repos, change_event::merge);
        changes.record(g.repos, change_event::to_config, dest.head_change_id());
    }
}

void relocator::remove_sources()
{
    Log::set_stage("removing relocated paths");
    for (auto const& g : moves.groups())
    {
        // Within one repository the rewrite already moved everything
        if (g.repos.source == g.repos.dest)
            continue;

        git_repository source(g.repos.source);
        bool removed = false;
        for (auto const& p : g.source_paths)
        {
            if (!fs::exists(fs::path(g.repos.source) / p.operand()))
                continue;
            source.remove_recursive(p.operand());
            removed = true;
        }
        if (!removed)
            continue;

        source.switch_to_branch(config.modified_branch);
        ensure_commit_hook(source, git_repository(g.repos.dest));
        source.commit("Subdirectories '" + g.source_paths.joined()
                      + "' relocated to repo '" + repo_basename(g.repos.dest) + "'");
        depend_on(source, g.repos, change_event::from_config);
        changes.record(g.repos, change_event::removal, source.head_change_id());
    }
}

void relocator::depend_on(git_repository& repo, repo_pair const& repos, change_event e)
{
    std::string const id = changes.lookup(repos, e);
    if (id.empty())
        return;
    Log::debug() << "linking " << repos << " to its " << to_string(e)
                 << " change " << id << std::endl;
    repo.append_to_head_message("Depends-On: " + id);
}

std::vector<std::string> relocator::new_repositories() const
{
    std::vector<std::string> result;
    for (auto const& repo : moves.repositories())
    {
        if (state_of(repo).is_new)
            result.push_back(repo);
    }
    return result;
}

void relocator::summarize(std::ostream& os) const
{
    Log::set_stage("summary");
    std::vector<std::string> const created = new_repositories();
    if (created.empty())
        return;
    os << "\nNew repos created at: ";
    for (auto const& repo : created)
        os << repo << " ";
    os << std::endl;
}

} // namespace splitrepo
