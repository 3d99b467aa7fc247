// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_VALIDATE_PLAN_HPP
# define SPLITREPO_VALIDATE_PLAN_HPP

# include "plan.hpp"

namespace splitrepo {

// Checks, before anything is modified, that every source repository
// is a directory and that every source path in it exists as a file or
// directory.  Throws precondition_error on the first miss.
void validate_plan(plan const& p);

} // namespace splitrepo

#endif // SPLITREPO_VALIDATE_PLAN_HPP
