// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SPLITREPO_PROCESS_HPP
# define SPLITREPO_PROCESS_HPP

# include <boost/filesystem/path.hpp>
# include <string>
# include <vector>

namespace splitrepo {

// A synchronous external command.  Nothing here is run concurrently:
// every call waits for the child to exit.
struct command
{
    command(boost::filesystem::path exe,
            std::vector<std::string> args,
            boost::filesystem::path dir = boost::filesystem::path())
        : exe(std::move(exe)), args(std::move(args)), dir(std::move(dir)), quiet(false)
    {}

    // Discard the child's stderr; for probes whose failure is expected
    command& silence() { quiet = true; return *this; }

    std::string describe() const;

    boost::filesystem::path exe;
    std::vector<std::string> args;
    boost::filesystem::path dir;   // empty means the current directory
    bool quiet;
};

// Runs cmd and returns its exit status.
int run_status(command const& cmd);

// Runs cmd; throws command_failed on a non-zero exit status.
void run(command const& cmd);

// Runs cmd and returns its exit status; stdout goes to output.
int run_capture(command const& cmd, std::string& output);

// Runs cmd and returns its stdout; throws command_failed on a non-zero
// exit status.
std::string capture(command const& cmd);

// Runs cmd with input on its stdin; throws command_failed on a
// non-zero exit status.
void run_with_input(command const& cmd, std::string const& input);

} // namespace splitrepo

#endif // SPLITREPO_PROCESS_HPP
