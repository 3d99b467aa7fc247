// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "process.hpp"
#include "git_executable.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <boost/process.hpp>
#include <boost/filesystem.hpp>
#include <iterator>

namespace bp = boost::process;
namespace fs = boost::filesystem;

namespace splitrepo {

namespace
{
  std::string git_exe_override;

  fs::path start_dir_of(command const& cmd)
  {
      return cmd.dir.empty() ? fs::current_path() : cmd.dir;
  }

  void announce(command const& cmd)
  {
      Log::debug() << "in " << start_dir_of(cmd).generic_string()
                   << ": " << cmd.describe() << std::endl;
  }
}

void set_git_executable(std::string const& exe)
{
    git_exe_override = exe;
}

fs::path const& git_executable()
{
    static fs::path const git_exe
        = git_exe_override.empty()
        ? bp::search_path("git")
        : fs::path(git_exe_override);

    if (git_exe.empty())
        throw configuration_error("git executable not found in PATH; use --git");
    return git_exe;
}

std::string command::describe() const
{
    std::string result = exe.filename().string();
    for (auto const& a : args)
    {
        result += ' ';
        if (a.find_first_of(" \t'\"") != std::string::npos)
            result += '\'' + a + '\'';
        else
            result += a;
    }
    return result;
}

int run_status(command const& cmd)
{
    announce(cmd);
    bp::child child = cmd.quiet
        ? bp::child(bp::exe = cmd.exe, bp::args = cmd.args,
                    bp::start_dir = start_dir_of(cmd), bp::std_err > bp::null)
        : bp::child(bp::exe = cmd.exe, bp::args = cmd.args,
                    bp::start_dir = start_dir_of(cmd));
    child.wait();
    return child.exit_code();
}

void run(command const& cmd)
{
    int status = run_status(cmd);
    if (status != 0)
        throw command_failed(cmd.describe(), status);
}

int run_capture(command const& cmd, std::string& output)
{
    announce(cmd);
    bp::ipstream out;
    bp::child child = cmd.quiet
        ? bp::child(bp::exe = cmd.exe, bp::args = cmd.args,
                    bp::start_dir = start_dir_of(cmd),
                    bp::std_out > out, bp::std_err > bp::null)
        : bp::child(bp::exe = cmd.exe, bp::args = cmd.args,
                    bp::start_dir = start_dir_of(cmd),
                    bp::std_out > out);
    output.assign(std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>());
    child.wait();
    return child.exit_code();
}

std::string capture(command const& cmd)
{
    std::string output;
    int status = run_capture(cmd, output);
    if (status != 0)
        throw command_failed(cmd.describe(), status);
    return output;
}

void run_with_input(command const& cmd, std::string const& input)
{
    announce(cmd);
    bp::opstream in;
    bp::child child(bp::exe = cmd.exe, bp::args = cmd.args,
                    bp::start_dir = start_dir_of(cmd), bp::std_in < in);
    in << input;
    in.flush();
    in.pipe().close();
    child.wait();
    if (child.exit_code() != 0)
        throw command_failed(cmd.describe(), child.exit_code());
}

} // namespace splitrepo
