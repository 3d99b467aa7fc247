// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "history_rewriter.hpp"
#include "errors.hpp"
#include "git_executable.hpp"
#include "log.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/process.hpp>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace bp = boost::process;

namespace splitrepo {

namespace
{
  // I/O manipulator that sends a linefeed character with no translation
  std::ostream& LF(std::ostream& stream)
  {
      stream.rdbuf()->sputc('\n');
      return stream;
  }

  // Splits off the first path of an R or C command's argument text
  std::string::size_type first_path_end(std::string const& text)
  {
      if (!boost::starts_with(text, "\""))
          return text.find(' ');

      for (std::string::size_type i = 1; i < text.size(); ++i)
      {
          if (text[i] == '\\')
              ++i;
          else if (text[i] == '"')
              return i + 1;
      }
      throw std::runtime_error("unterminated quoted path in fast-export stream: " + text);
  }

  std::string rewrite(std::string const& spelled, rewrite_ruleset const& rules, bool space_terminated)
  {
      repo_path const original(unquote_path(spelled));
      repo_path const rewritten = rules.apply(original);
      if (Log::get_level() >= Log::Trace && !(rewritten == original))
          Log::trace() << original << " -> " << rewritten << std::endl;
      return quote_path(rewritten.str(), space_terminated);
  }
}

std::string unquote_path(std::string const& quoted)
{
    if (!boost::starts_with(quoted, "\""))
        return quoted;

    std::string result;
    std::string::size_type i = 1;
    for (; i < quoted.size() && quoted[i] != '"'; ++i)
    {
        char c = quoted[i];
        if (c != '\\')
        {
            result += c;
            continue;
        }
        if (++i == quoted.size())
            break;
        c = quoted[i];
        switch (c)
        {
        case 'a': result += '\a'; break;
        case 'b': result += '\b'; break;
        case 'f': result += '\f'; break;
        case 'n': result += '\n'; break;
        case 'r': result += '\r'; break;
        case 't': result += '\t'; break;
        case 'v': result += '\v'; break;
        case '0': case '1': case '2': case '3':
            if (i + 2 < quoted.size())
            {
                int value = (c - '0') * 64 + (quoted[i + 1] - '0') * 8 + (quoted[i + 2] - '0');
                result += static_cast<char>(value);
                i += 2;
            }
            break;
        default:
            result += c;
        }
    }
    if (i == quoted.size())
        throw std::runtime_error("unterminated quoted path: " + quoted);
    return result;
}

std::string quote_path(std::string const& p, bool space_terminated)
{
    bool needs_quotes = boost::starts_with(p, "\"")
        || (space_terminated && p.find(' ') != std::string::npos);
    for (char c : p)
    {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f || c == '\\')
            needs_quotes = true;
    }
    if (!needs_quotes)
        return p;

    std::string result = "\"";
    for (char c : p)
    {
        unsigned char u = static_cast<unsigned char>(c);
        switch (c)
        {
        case '"': result += "\\\""; break;
        case '\\': result += "\\\\"; break;
        case '\a': result += "\\a"; break;
        case '\b': result += "\\b"; break;
        case '\f': result += "\\f"; break;
        case '\n': result += "\\n"; break;
        case '\r': result += "\\r"; break;
        case '\t': result += "\\t"; break;
        case '\v': result += "\\v"; break;
        default:
            if (u < 0x20 || u == 0x7f)
            {
                char octal[5];
                std::snprintf(octal, sizeof(octal), "\\%03o", u);
                result += octal;
            }
            else
            {
                result += c;
            }
        }
    }
    return result + "\"";
}

void rewrite_fast_export(std::istream& in, std::ostream& out, rewrite_ruleset const& rules)
{
    char const data_prefix[] = "data ";
    std::size_t const data_prefix_length = std::strlen(data_prefix);

    in.exceptions( std::istream::badbit );
    out.exceptions( std::ostream::failbit | std::ostream::badbit );

    std::string line;
    while (getline(in, line))
    {
        if (boost::starts_with(line, "M "))
        {
            // M <mode> <dataref> <path>
            std::string::size_type mode_end = line.find(' ', 2);
            std::string::size_type ref_end = mode_end == std::string::npos
                ? std::string::npos : line.find(' ', mode_end + 1);
            if (ref_end == std::string::npos)
                throw std::runtime_error("malformed filemodify in fast-export stream: " + line);
            out << line.substr(0, ref_end + 1)
                << rewrite(line.substr(ref_end + 1), rules, false) << LF;
        }
        else if (boost::starts_with(line, "D "))
        {
            out << "D " << rewrite(line.substr(2), rules, false) << LF;
        }
        else if (boost::starts_with(line, "R ") || boost::starts_with(line, "C "))
        {
            std::string const operands = line.substr(2);
            std::string::size_type split = first_path_end(operands);
            if (split == std::string::npos || split + 1 >= operands.size())
                throw std::runtime_error("malformed rename/copy in fast-export stream: " + line);
            out << line.substr(0, 2)
                << rewrite(operands.substr(0, split), rules, true) << " "
                << rewrite(operands.substr(split + 1), rules, false) << LF;
        }
        else
        {
            out << line << LF;
        }

        if (boost::starts_with(line, data_prefix))
        {
            std::size_t length = boost::lexical_cast<std::size_t>(
                line.substr(data_prefix_length));

            while (length > 0)
            {
                char buf[2048];
                std::size_t num_to_read = std::min(length, sizeof(buf));
                in.read(buf, num_to_read);
                if (static_cast<std::size_t>(in.gcount()) != num_to_read)
                    throw std::runtime_error("truncated data block in fast-export stream");
                out.write(buf, num_to_read);
                length -= num_to_read;
            }
        }
    }
}

void rewrite_history(git_repository& repo, rewrite_ruleset const& rules)
{
    std::string const branch = repo.current_branch();
    if (branch.empty())
        throw internal_error("no current branch in " + repo.work_tree().generic_string());
    if (!repo.has_commits())
    {
        Log::warn() << "nothing to rewrite in " << repo.work_tree().generic_string() << std::endl;
        return;
    }

    Log::info() << "rewriting history of " << repo.work_tree().generic_string()
                << " branch " << branch << std::endl;

    std::vector<std::string> const export_args = {
        "fast-export", "--no-data", "--signed-tags=strip",
        "--tag-of-filtered-object=drop", "refs/heads/" + branch };
    std::vector<std::string> const import_args = {
        "fast-import", "--quiet", "--force" };

    // Both ends run in the same repository: with --no-data every blob
    // is referred to by its existing object name.
    bp::ipstream exported;
    bp::opstream imported;
    bp::child git_fast_export(
        bp::exe = git_executable(), bp::args = export_args,
        bp::start_dir = repo.work_tree(), bp::std_out > exported);
    bp::child git_fast_import(
        bp::exe = git_executable(), bp::args = import_args,
        bp::start_dir = repo.work_tree(), bp::std_in < imported);

    rewrite_fast_export(exported, imported, rules);
    imported.flush();
    imported.pipe().close();

    git_fast_export.wait();
    git_fast_import.wait();
    if (git_fast_export.exit_code() != 0)
        throw command_failed("git fast-export in " + repo.work_tree().generic_string(),
                             git_fast_export.exit_code());
    if (git_fast_import.exit_code() != 0)
        throw command_failed("git fast-import in " + repo.work_tree().generic_string(),
                             git_fast_import.exit_code());

    repo.reset_hard();
}

} // namespace splitrepo
