// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "map_file.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fstream>
#include <vector>

namespace splitrepo {

namespace
{
  std::string normalize_repo(std::string repo)
  {
      while (repo.size() > 1 && repo[repo.size() - 1] == '/')
          repo.erase(repo.size() - 1);
      return repo;
  }
}

plan parse_map(std::istream& in, std::string const& filename, std::string const& os)
{
    plan_builder builder(os);
    std::vector<std::size_t> bad_lines;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(in, line))
    {
        ++line_number;
        std::string const trimmed = boost::trim_copy(line);
        if (trimmed.empty())
            continue;
        if (trimmed[0] == '#')
        {
            Log::trace() << "skip comment at line " << line_number << std::endl;
            continue;
        }

        std::vector<std::string> fields;
        boost::split(fields, trimmed, boost::is_any_of("|"));
        for (auto& f : fields)
            boost::trim(f);

        if (fields.size() != 4
            || fields[0].empty() || fields[1].empty()
            || fields[2].empty() || fields[3].empty())
        {
            Log::error() << filename << ":" << line_number
                         << ": error: malformed line '" << line << "'" << std::endl;
            bad_lines.push_back(line_number);
            continue;
        }

        move_request request;
        request.source_repo = normalize_repo(fields[0]);
        request.source_path = repo_path(fields[1]);
        request.dest_repo = normalize_repo(fields[2]);
        request.dest_path = repo_path(fields[3]);
        request.line = line_number;
        builder.add(request);
    }

    if (!bad_lines.empty())
        throw malformed_map_error(filename, bad_lines);

    plan result = builder.build();
    if (result.empty())
        throw configuration_error("map file '" + filename + "' contains no moves");
    return result;
}

plan parse_map_file(std::string const& filename, std::string const& os)
{
    std::ifstream file(filename.c_str());
    if (!file)
    {
        throw configuration_error("cannot read map file: " + filename);
    }
    return parse_map(file, filename, os);
}

} // namespace splitrepo
