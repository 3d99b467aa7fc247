// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "package_list.hpp"
#include "file_utils.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/regex.hpp>
#include <algorithm>

namespace splitrepo {

namespace
{
  // Replaces the first match of pattern in line by group 1 of the
  // match (when the pattern has one) followed by replacement, the way
  // "sed s#^\(prefix\)old#\1new#" does.
  bool substitute_first(std::string& line, boost::regex const& pattern, std::string const& replacement)
  {
      boost::smatch m;
      if (!boost::regex_search(line, m, pattern))
          return false;
      std::string kept = m.size() > 1 && m[1].matched ? m.str(1) : std::string();
      line = m.prefix().str() + kept + replacement + m.suffix().str();
      return true;
  }

  struct substitution
  {
      boost::regex pattern;
      std::string replacement;
  };

  bool apply_substitutions(std::string& text, std::vector<substitution> const& subs)
  {
      std::vector<std::string> lines = split_lines(text);
      bool changed = false;
      for (auto& line : lines)
      {
          for (auto const& s : subs)
          {
              std::string before = line;
              if (substitute_first(line, s.pattern, s.replacement) && line != before)
                  changed = true;
          }
      }
      if (changed)
          text = join_lines(lines);
      return changed;
  }

  std::size_t erase_lines(std::vector<std::string>& lines, std::string const& value)
  {
      auto end = std::remove(lines.begin(), lines.end(), value);
      std::size_t n = lines.end() - end;
      lines.erase(end, lines.end());
      return n;
  }
}

std::vector<std::string> split_lines(std::string const& text)
{
    std::vector<std::string> lines;
    if (text.empty())
        return lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    if (boost::ends_with(text, "\n"))
        lines.pop_back();
    return lines;
}

std::string join_lines(std::vector<std::string> const& lines)
{
    std::string text;
    for (auto const& line : lines)
        text += line + "\n";
    return text;
}

std::size_t move_list_entries(
    std::string& source, std::string& dest,
    std::string const& from, std::string const& to)
{
    std::vector<std::string> source_lines = split_lines(source);
    std::size_t moved = erase_lines(source_lines, from);
    if (moved == 0)
        return 0;

    std::vector<std::string> dest_lines = split_lines(dest);
    dest_lines.insert(dest_lines.end(), moved, to);

    source = join_lines(source_lines);
    dest = join_lines(dest_lines);
    return moved;
}

std::size_t move_image_entries(
    std::string& source, std::string& dest,
    std::string const& from, std::string const& to)
{
    std::vector<std::string> source_lines = split_lines(source);
    if (std::find(source_lines.begin(), source_lines.end(), from) == source_lines.end())
        return 0;

    std::vector<std::string> dest_lines = split_lines(dest);
    std::size_t headers = erase_lines(source_lines, "# " + from);
    for (std::size_t i = 0; i < headers; ++i)
    {
        dest_lines.push_back("");
        dest_lines.push_back("# " + to);
    }
    std::size_t moved = erase_lines(source_lines, from);
    dest_lines.insert(dest_lines.end(), moved, to);

    source = join_lines(source_lines);
    dest = join_lines(dest_lines);
    return moved;
}

std::vector<std::string> subpackage_names(std::string const& spec, std::string const& package)
{
    std::string const by_macro = "%package -n %{name}";
    std::string const by_name = "%package -n " + package;

    std::vector<std::string> lines = split_lines(spec);
    std::vector<std::string> result;
    for (auto const& line : lines)
    {
        if (boost::starts_with(line, by_macro))
            result.push_back(package + line.substr(by_macro.size()));
    }
    for (auto const& line : lines)
    {
        if (boost::starts_with(line, by_name))
            result.push_back(package + line.substr(by_name.size()));
    }
    return result;
}

std::string rename_package(std::string const& name, std::string const& from, std::string const& to)
{
    if (!from.empty() && boost::starts_with(name, from))
        return to + name.substr(from.size());
    return name;
}

bool rename_in_pkg_info(std::string& text, std::string const& from, std::string const& to)
{
    return apply_substitutions(text, {
        {boost::regex("^Name: " + regex_escape(from) + "$"), "Name: " + to}
    });
}

bool rename_in_spec(std::string& text, std::string const& from, std::string const& to)
{
    std::string const f = regex_escape(from);
    return apply_substitutions(text, {
        {boost::regex("^Name: " + f + "$"), "Name: " + to},
        {boost::regex("^Summary: " + f), "Summary: " + to},
        {boost::regex("^(%[a-z]* -n )" + f), to}
    });
}

bool rename_in_build_srpm_data(std::string& text, std::string const& from, std::string const& to)
{
    std::string const f = regex_escape(from);
    return apply_substitutions(text, {
        {boost::regex("^(SRC_DIR=\")" + f), to},
        {boost::regex("^(SRC_DIR=\"\\$PKG_BASE/)" + f), to},
        {boost::regex("^(SRC_DIR=)" + f), to},
        {boost::regex("^(SRC_DIR=\\$PKG_BASE/)" + f), to},
        {boost::regex("^(TAR_NAME=\")" + f + "\""), to + "\""},
        {boost::regex("^(TAR_NAME=)" + f), to},
        {boost::regex("^(COPY_LIST=\")" + f), to},
        {boost::regex("^(COPY_LIST=\"\\$PKG_BASE/)" + f), to},
        {boost::regex("( \\$PKG_BASE/)" + f), to}
    });
}

bool mentions_requirement(std::string const& spec, std::string const& package)
{
    return boost::regex_search(spec, boost::regex("Requires:[ ]*" + regex_escape(package)));
}

bool rename_requirement(std::string& spec, std::string const& from, std::string const& to)
{
    std::string const f = regex_escape(from);
    return apply_substitutions(spec, {
        {boost::regex("^(BuildRequires:[ ]*)" + f + "$"), to},
        {boost::regex("^(Requires:[ ]*)" + f + "$"), to}
    });
}

} // namespace splitrepo
