// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_GIT_EXECUTABLE_HPP
# define SPLITREPO_GIT_EXECUTABLE_HPP

# include <boost/filesystem/path.hpp>
# include <string>

namespace splitrepo {

// Use the given executable instead of searching PATH.  Must be called
// before the first call to git_executable() to have any effect.
void set_git_executable(std::string const& exe);

// The git executable, resolved once; throws configuration_error if
// there is none.
boost::filesystem::path const& git_executable();

} // namespace splitrepo

#endif // SPLITREPO_GIT_EXECUTABLE_HPP
