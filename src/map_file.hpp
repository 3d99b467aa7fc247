// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_MAP_FILE_HPP
# define SPLITREPO_MAP_FILE_HPP

# include "plan.hpp"
# include <istream>
# include <string>

namespace splitrepo {

// Reads "source_repo|source_path|dest_repo|dest_path" rows.  Every
// malformed row is reported before malformed_map_error is thrown; an
// empty plan is a configuration_error.
plan parse_map(std::istream& in, std::string const& filename, std::string const& os);

plan parse_map_file(std::string const& filename, std::string const& os);

} // namespace splitrepo

#endif // SPLITREPO_MAP_FILE_HPP
