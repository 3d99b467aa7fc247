/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
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

#ifndef SPLITREPO_ERRORS_HPP
#define SPLITREPO_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace splitrepo
{

// Bad map file, missing filter tool, bad command line
class configuration_error: public std::runtime_error
  {
  public:
    explicit configuration_error(std::string const& message)
        : std::runtime_error(message)
      {
      }
  };

// Thrown once the whole map file has been read and at least one line
// was unusable; every offending line number is kept.
class malformed_map_error: public configuration_error
  {
  public:
    malformed_map_error(std::string const& filename, std::vector<std::size_t> const& lines)
        : configuration_error(
            filename + ": " + std::to_string(lines.size()) + " malformed line(s)")
        , lines_(lines)
      {
      }
    std::vector<std::size_t> const& lines() const
      {
      return lines_;
      }
  private:
    std::vector<std::size_t> lines_;
  };

// Something the map file refers to is not on disk
class precondition_error: public std::runtime_error
  {
  public:
    explicit precondition_error(std::string const& message)
        : std::runtime_error(message)
      {
      }
  };

// An intermediate artifact that an earlier stage should have produced
// is missing
class internal_error: public std::logic_error
  {
  public:
    explicit internal_error(std::string const& message)
        : std::logic_error(message)
      {
      }
  };

class command_failed: public std::runtime_error
  {
  public:
    command_failed(std::string const& command, int status)
        : std::runtime_error(
            "command failed with status " + std::to_string(status) + ": " + command)
        , status_(status)
      {
      }
    int status() const
      {
      return status_;
      }
  private:
    int status_;
  };

} // namespace splitrepo

#endif /* SPLITREPO_ERRORS_HPP */
