/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef SPLITREPO_OPTIONS_HPP
#define SPLITREPO_OPTIONS_HPP

#include <string>

namespace splitrepo
{

struct settings
  {
  settings()
      : map_file("repo.map")
      , new_branch("master")
      , modified_branch("work")
      , os("centos")
      , dry_run(false)
    {
    }

  std::string map_file;
  // Branch given to repositories this run creates
  std::string new_branch;
  // Branch on which every pre-existing repository receives its edits
  std::string modified_branch;
  // Per-distribution subdirectory holding spec files and package lists
  std::string os;
  std::string git_executable;
  bool dry_run;
  };

} // namespace splitrepo

#endif /* SPLITREPO_OPTIONS_HPP */
