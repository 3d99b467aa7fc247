// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "metadata_fixers.hpp"
#include "commit_hook.hpp"
#include "file_utils.hpp"
#include "git_repository.hpp"
#include "log.hpp"
#include "package_list.hpp"

#include <boost/filesystem/operations.hpp>
#include <algorithm>

namespace fs = boost::filesystem;

namespace splitrepo {

namespace
{
  // Stages file, which lives somewhere inside repo's working tree
  void stage(git_repository& repo, fs::path const& file)
  {
      repo.add(fs::relative(file, repo.work_tree()).generic_string());
  }

  fs::path component_dir(fixer_context const& ctx, path_mapping const& m)
  {
      return fs::path(ctx.group.repos.dest) / m.dest_path.str();
  }

  fs::path os_dir(fixer_context const& ctx, path_mapping const& m)
  {
      return component_dir(ctx, m) / ctx.config.os;
  }

  std::vector<fs::path> own_specs(fixer_context const& ctx, path_mapping const& m)
  {
      return files_in(os_dir(ctx, m), boost::regex(".*\\.spec"));
  }

  std::vector<std::string> const& subpackages_of(fixer_context const& ctx, path_mapping const& m)
  {
      static std::vector<std::string> const none;
      auto const found = ctx.subpackages.find(m.source_path.str());
      return found == ctx.subpackages.end() ? none : found->second;
  }

  // Runs mover over the contents of the source list src_cfg and of the
  // destination's list of the same name, then writes back and stages
  // whatever changed.
  template <class Mover>
  void transfer_entries(fixer_context const& ctx, fs::path const& src_cfg, Mover mover)
  {
      git_repository source(ctx.group.repos.source);
      git_repository dest(ctx.group.repos.dest);
      fs::path const dest_cfg = fs::path(ctx.group.repos.dest) / src_cfg.filename();

      std::string source_text = read_file(src_cfg);

      // Moving within one repository: the entries go to the end of the
      // same list
      if (fs::exists(dest_cfg) && fs::equivalent(src_cfg, dest_cfg))
      {
          std::string moved;
          if (mover(source_text, moved) == 0)
              return;
          Log::info() << "moving entries within " << src_cfg.generic_string() << std::endl;
          write_file(src_cfg, source_text + moved);
          stage(source, src_cfg);
          return;
      }

      std::string dest_text = fs::exists(dest_cfg) ? read_file(dest_cfg) : std::string();

      if (mover(source_text, dest_text) == 0)
          return;

      Log::info() << "moving entries from " << src_cfg.generic_string()
                  << " to " << dest_cfg.generic_string() << std::endl;
      write_file(dest_cfg, dest_text);
      stage(dest, dest_cfg);
      write_file(src_cfg, source_text);
      stage(source, src_cfg);
  }

  boost::regex list_pattern(fixer_context const& ctx, std::string const& tail)
  {
      return boost::regex(regex_escape(ctx.config.os) + tail);
  }

  // Rewrites file in place with edit, staging it in repo if it changed
  template <class Edit>
  void edit_file(git_repository& repo, fs::path const& file, Edit edit)
  {
      std::string text = read_file(file);
      if (!edit(text))
          return;
      Log::info() << "updating " << file.generic_string() << std::endl;
      write_file(file, text);
      stage(repo, file);
  }
}

subpackage_map declared_subpackages(fixer_context const& ctx)
{
    subpackage_map result;
    for (auto const& m : ctx.group.mappings)
    {
        std::vector<std::string>& names = result[m.source_path.str()];
        for (auto const& spec : own_specs(ctx, m))
        {
            for (auto const& name : subpackage_names(read_file(spec), m.from_name()))
            {
                if (std::find(names.begin(), names.end(), name) == names.end())
                    names.push_back(name);
            }
        }
        Log::trace() << m.source_path << " declares " << names.size()
                     << " sub-package(s)" << std::endl;
    }
    return result;
}

void fix_branches(fixer_context const& ctx)
{
    git_repository(ctx.group.repos.source).switch_to_branch(ctx.config.modified_branch);
    git_repository(ctx.group.repos.dest).switch_to_branch(
        ctx.dest_is_new ? ctx.config.new_branch : ctx.config.modified_branch);
}

void fix_package_dirs(fixer_context const& ctx)
{
    for (auto const& src_cfg : files_in(ctx.group.repos.source, list_pattern(ctx, "_pkg_dirs.*")))
    {
        for (auto const& m : ctx.group.mappings)
        {
            transfer_entries(ctx, src_cfg, [&](std::string& s, std::string& d) {
                return move_list_entries(s, d, m.source_path.str(), m.dest_path.str());
            });
        }
    }
}

void fix_wheels_lists(fixer_context const& ctx)
{
    for (auto const& src_cfg : files_in(ctx.group.repos.source, list_pattern(ctx, "_.*_wheels\\.inc")))
    {
        for (auto const& m : ctx.group.mappings)
        {
            transfer_entries(ctx, src_cfg, [&](std::string& s, std::string& d) {
                return move_list_entries(s, d, m.from_name() + "-wheels", m.to_name() + "-wheels");
            });
        }
    }
}

void fix_image_lists(fixer_context const& ctx)
{
    boost::regex const pattern(
        "(?:" + regex_escape(ctx.config.os) + "_iso_image\\.inc"
        "|" + regex_escape(ctx.config.os) + "_guest_image.*\\.inc)");

    for (auto const& src_cfg : files_in(ctx.group.repos.source, pattern))
    {
        for (auto const& m : ctx.group.mappings)
        {
            std::string const src_pkg = m.from_name();
            std::string const dest_pkg = m.to_name();
            transfer_entries(ctx, src_cfg, [&](std::string& s, std::string& d) {
                return move_image_entries(s, d, src_pkg, dest_pkg);
            });

            for (auto const& extra : subpackages_of(ctx, m))
            {
                std::string const renamed = rename_package(extra, src_pkg, dest_pkg);
                transfer_entries(ctx, src_cfg, [&](std::string& s, std::string& d) {
                    return move_list_entries(s, d, extra, renamed);
                });
            }
        }
    }
}

void fix_pkg_info(fixer_context const& ctx)
{
    git_repository dest(ctx.group.repos.dest);
    for (auto const& m : ctx.group.mappings)
    {
        if (!m.renamed())
            continue;
        for (auto const& file : files_in(component_dir(ctx, m), boost::regex("PKG-INFO")))
        {
            edit_file(dest, file, [&](std::string& text) {
                return rename_in_pkg_info(text, m.from_name(), m.to_name());
            });
        }
    }
}

void fix_specs(fixer_context const& ctx)
{
    git_repository dest(ctx.group.repos.dest);
    for (auto const& m : ctx.group.mappings)
    {
        if (!m.renamed())
            continue;
        for (auto const& file : own_specs(ctx, m))
        {
            edit_file(dest, file, [&](std::string& text) {
                return rename_in_spec(text, m.from_name(), m.to_name());
            });
        }
    }
}

void fix_build_srpm_data(fixer_context const& ctx)
{
    git_repository dest(ctx.group.repos.dest);
    for (auto const& m : ctx.group.mappings)
    {
        if (!m.renamed())
            continue;
        for (auto const& file : files_in(os_dir(ctx, m), boost::regex("build_srpm\\.data")))
        {
            edit_file(dest, file, [&](std::string& text) {
                return rename_in_build_srpm_data(text, m.from_name(), m.to_name());
            });
        }
    }
}

namespace
{
  // A copy of a moved component still sitting in its old repository,
  // waiting for the removal commit
  bool is_relocated_original(plan const& moves, fs::path const& spec)
  {
      for (auto const& g : moves.groups())
      {
          for (auto const& m : g.mappings)
          {
              if (is_within(spec, fs::path(g.repos.source) / m.source_path.str()))
                  return true;
          }
      }
      return false;
  }
}

void fix_dependent_specs(fixer_context const& ctx, change_linkage& changes)
{
    git_repository const donor(ctx.group.repos.source);

    for (auto const& m : ctx.group.mappings)
    {
        if (!m.renamed())
            continue;

        std::string const from = m.from_name();
        std::string const to = m.to_name();
        Log::debug() << "looking for specs requiring " << from << std::endl;

        std::vector<std::string> names(1, from);
        for (auto const& extra : subpackages_of(ctx, m))
        {
            if (std::find(names.begin(), names.end(), extra) == names.end())
                names.push_back(extra);
        }

        // Git roots touched, in order of first edit
        std::vector<fs::path> roots;

        for (auto const& spec : files_below(".", boost::regex(".*\\.spec")))
        {
            if (is_within(spec, os_dir(ctx, m)))
            {
                Log::trace() << "skipping own spec " << spec.generic_string() << std::endl;
                continue;
            }
            if (is_relocated_original(ctx.moves, spec))
            {
                Log::trace() << "skipping relocated spec " << spec.generic_string() << std::endl;
                continue;
            }

            std::string text = read_file(spec);
            bool changed = false;
            for (auto const& name : names)
            {
                if (mentions_requirement(text, name))
                    changed = rename_requirement(text, name, rename_package(name, from, to)) || changed;
            }
            if (!changed)
                continue;

            fs::path const root = find_enclosing(spec.parent_path(), ".git");
            if (root.empty())
            {
                Log::warn() << spec.generic_string() << " requires " << from
                            << " but is not inside a git repository; left alone" << std::endl;
                continue;
            }

            Log::info() << "updating requirements in " << spec.generic_string() << std::endl;
            write_file(spec, text);
            git_repository repo(root);
            repo.switch_to_branch(ctx.config.modified_branch);
            repo.add(fs::relative(fs::canonical(spec), root).generic_string());
            if (std::find(roots.begin(), roots.end(), root) == roots.end())
                roots.push_back(root);
        }

        for (auto const& root : roots)
        {
            git_repository repo(root);
            if (!repo.has_staged_changes())
                continue;
            ensure_commit_hook(repo, donor);
            repo.commit("Fix spec's Requires due to rename of package '" + from + "' to '" + to + "'");
            std::string const depends = changes.lookup(ctx.group.repos, change_event::to_config);
            if (!depends.empty())
                repo.append_to_head_message("Depends-On: " + depends);
        }
    }
}

} // namespace splitrepo
