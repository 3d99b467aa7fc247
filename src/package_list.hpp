// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_PACKAGE_LIST_HPP
# define SPLITREPO_PACKAGE_LIST_HPP

// Text transformations applied by the metadata fixers.  Each works on
// the whole content of one file and is line oriented; none touches the
// disk.

# include <string>
# include <vector>

namespace splitrepo {

std::vector<std::string> split_lines(std::string const& text);
std::string join_lines(std::vector<std::string> const& lines);

// Removes every line of source equal to from and appends to dest one
// line "to" for each.  Returns the number of lines moved.
std::size_t move_list_entries(
    std::string& source, std::string& dest,
    std::string const& from, std::string const& to);

// Like move_list_entries for image package lists, which may also
// carry a "# <package>" header line; a moved header is preceded by a
// blank line.  Nothing happens unless the package itself is listed.
std::size_t move_image_entries(
    std::string& source, std::string& dest,
    std::string const& from, std::string const& to);

// The packages a spec file builds under the name package: one per
// "%package -n %{name}<suffix>" or "%package -n <package><suffix>"
// line, each spelled "<package><suffix>".
std::vector<std::string> subpackage_names(
    std::string const& spec, std::string const& package);

// name with a leading from replaced by to; other names are returned
// unchanged.
std::string rename_package(
    std::string const& name, std::string const& from, std::string const& to);

// "Name: <from>" in a PKG-INFO file.  Returns true if anything changed.
bool rename_in_pkg_info(std::string& text, std::string const& from, std::string const& to);

// Name, Summary and "%<section> -n" lines of a spec file.
bool rename_in_spec(std::string& text, std::string const& from, std::string const& to);

// SRC_DIR, TAR_NAME and COPY_LIST assignments, plain, quoted or
// relative to $PKG_BASE, in build_srpm.data.
bool rename_in_build_srpm_data(std::string& text, std::string const& from, std::string const& to);

// True if some Requires or BuildRequires line names package (or a
// package it prefixes).
bool mentions_requirement(std::string const& spec, std::string const& package);

// Requires and BuildRequires lines naming exactly from.
bool rename_requirement(std::string& spec, std::string const& from, std::string const& to);

} // namespace splitrepo

#endif // SPLITREPO_PACKAGE_LIST_HPP
