// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_FILE_UTILS_HPP
# define SPLITREPO_FILE_UTILS_HPP

# include <boost/filesystem/path.hpp>
# include <boost/regex.hpp>
# include <string>
# include <vector>

namespace splitrepo {

// Copies the tree at from to the new directory to, following
// symbolic links the way "cp -pLr" does.
void copy_tree(boost::filesystem::path const& from, boost::filesystem::path const& to);

// Regular files directly inside dir whose names match pattern; sorted.
// A missing dir yields nothing.
std::vector<boost::filesystem::path> files_in(
    boost::filesystem::path const& dir, boost::regex const& pattern);

// Regular files anywhere below dir whose names match pattern, not
// descending into .git directories; sorted.
std::vector<boost::filesystem::path> files_below(
    boost::filesystem::path const& dir, boost::regex const& pattern);

std::string read_file(boost::filesystem::path const& file);
void write_file(boost::filesystem::path const& file, std::string const& content);

// True if p names dir itself or something below it; both must exist.
bool is_within(boost::filesystem::path const& p, boost::filesystem::path const& dir);

// Escapes s for literal use inside a regular expression
std::string regex_escape(std::string const& s);

} // namespace splitrepo

#endif // SPLITREPO_FILE_UTILS_HPP
