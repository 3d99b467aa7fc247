// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_METADATA_FIXERS_HPP
# define SPLITREPO_METADATA_FIXERS_HPP

# include "change_linkage.hpp"
# include "options.hpp"
# include "plan.hpp"
# include <boost/container/flat_map.hpp>
# include <string>
# include <vector>

namespace splitrepo {

// What every fixer needs to know about the move being patched up
// Sub-package names declared by the specs of each moved component,
// keyed by the component's source path
typedef boost::container::flat_map<std::string, std::vector<std::string> > subpackage_map;

struct fixer_context
{
    settings const& config;
    plan const& moves;
    filter_group const& group;
    bool dest_is_new;
    subpackage_map subpackages;
};

// Must run before fix_specs, which renames the declarations
subpackage_map declared_subpackages(fixer_context const& ctx);

// Puts the source on the modified branch and the destination on the
// new-repository or modified branch, before any edits land.
void fix_branches(fixer_context const& ctx);

// Package lists at the repository root.  Entries for moved components
// go from the source's list to the destination's list of the same
// name, renamed if the component was.
void fix_package_dirs(fixer_context const& ctx);
void fix_wheels_lists(fixer_context const& ctx);
void fix_image_lists(fixer_context const& ctx);

// Files inside a renamed component
void fix_pkg_info(fixer_context const& ctx);
void fix_specs(fixer_context const& ctx);
void fix_build_srpm_data(fixer_context const& ctx);

// Requires and BuildRequires naming a renamed package, in every spec
// file below the current directory.  Unlike the fixers above this one
// commits, once per repository touched, declaring a dependency on the
// destination's metadata commit.
void fix_dependent_specs(fixer_context const& ctx, change_linkage& changes);

} // namespace splitrepo

#endif // SPLITREPO_METADATA_FIXERS_HPP
