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

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>

#include "git_executable.hpp"
#include "history_filter.hpp"
#include "log.hpp"
#include "map_file.hpp"
#include "options.hpp"
#include "relocator.hpp"
#include "validate_plan.hpp"

int main(int argc, char **argv)
{
    using namespace splitrepo;
    settings config;
    try
    {
        namespace po = boost::program_options;
        po::options_description program_options("Usage: split-repo [options]\n\nAllowed options");
        program_options.add_options()
            ("help,h", "produce help message")
            ("version,v", "print version string")
            ("quiet,q", "be quiet")
            ("verbose,V", "be verbose")
            ("extra-verbose", "be even more verbose")
            ("map-file,M", po::value(&config.map_file)->value_name("FILENAME")->default_value(config.map_file), "path to the map file")
            ("new-repo-branch,n", po::value(&config.new_branch)->value_name("BRANCH")->default_value(config.new_branch), "branch to create for new repos")
            ("modified-repo-branch,m", po::value(&config.modified_branch)->value_name("BRANCH")->default_value(config.modified_branch), "branch to create for modified repos")
            ("os", po::value(&config.os)->value_name("NAME")->default_value(config.os), "distribution subdirectory holding spec files")
            ("git", po::value(&config.git_executable)->value_name("PATH"), "git executable to use")
            ("dry-run", "print the plan and exit without touching any repository")
            ;
        po::variables_map variables;
        store(po::command_line_parser(argc, argv)
              .options(program_options)
              .run(), variables);
        if (variables.count("help"))
        {
            std::cout << program_options << std::endl;
            return 0;
        }
        if (variables.count("version"))
        {
            std::cout << "split-repo 0.1" << std::endl;
            return 0;
        }
        if (variables.count("quiet"))
        {
            Log::set_level(Log::Warning);
        }
        if (variables.count("verbose"))
        {
            Log::set_level(Log::Debug);
        }
        if (variables.count("extra-verbose"))
        {
            Log::set_level(Log::Trace);
        }
        config.dry_run = variables.count("dry-run") > 0;
        notify(variables);

        if (!config.git_executable.empty())
            set_git_executable(config.git_executable);

        // Before any repository is touched
        oslo_history_filter const history(locate_filter_tool());
        Log::debug() << "using " << history.executable().generic_string() << std::endl;

        Log::set_stage("reading " + config.map_file);
        plan const moves = parse_map_file(config.map_file, config.os);

        Log::set_stage("validating");
        validate_plan(moves);

        if (config.dry_run)
        {
            print_plan(std::cout, moves);
            return 0;
        }

        relocator mover(config, moves, history);
        mover.run(std::cout);
    }
    catch (std::exception const& error)
    {
        Log::error() << error.what() << "\n\n";
        return EXIT_FAILURE;
    }
    return Log::result();
}
