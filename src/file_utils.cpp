// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "file_utils.hpp"
#include "log.hpp"

#include <boost/filesystem.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = boost::filesystem;

namespace splitrepo {

void copy_tree(fs::path const& from, fs::path const& to)
{
    fs::create_directories(to);
    for (fs::directory_iterator p(from), end; p != end; ++p)
    {
        fs::path const target = to / p->path().filename();
        // status() rather than symlink_status(): links are followed
        fs::file_status const s = fs::status(p->path());
        if (fs::is_directory(s))
        {
            copy_tree(p->path(), target);
        }
        else if (fs::is_regular_file(s))
        {
            fs::copy_file(p->path(), target);
            fs::last_write_time(target, fs::last_write_time(p->path()));
        }
        else
        {
            Log::warn() << "not copying " << p->path().generic_string()
                        << ": not a file or directory" << std::endl;
        }
    }
}

std::vector<fs::path> files_in(fs::path const& dir, boost::regex const& pattern)
{
    std::vector<fs::path> result;
    if (!fs::is_directory(dir))
        return result;
    for (fs::directory_iterator p(dir), end; p != end; ++p)
    {
        if (fs::is_regular_file(p->status())
            && boost::regex_match(p->path().filename().string(), pattern))
            result.push_back(p->path());
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<fs::path> files_below(fs::path const& dir, boost::regex const& pattern)
{
    std::vector<fs::path> result;
    if (!fs::is_directory(dir))
        return result;
    fs::recursive_directory_iterator p(dir), end;
    while (p != end)
    {
        if (p->path().filename() == ".git")
        {
            p.disable_recursion_pending();
        }
        else if (fs::is_regular_file(p->symlink_status())
                 && boost::regex_match(p->path().filename().string(), pattern))
        {
            result.push_back(p->path());
        }
        ++p;
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::string read_file(fs::path const& file)
{
    std::ifstream in(file.string().c_str(), std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot read " + file.generic_string());
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(fs::path const& file, std::string const& content)
{
    std::ofstream out(file.string().c_str(), std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot write " + file.generic_string());
    out << content;
    if (!out)
        throw std::runtime_error("error writing " + file.generic_string());
}

bool is_within(fs::path const& p, fs::path const& dir)
{
    boost::system::error_code ec;
    fs::path const inner = fs::canonical(p, ec);
    if (ec)
        return false;
    fs::path const outer = fs::canonical(dir, ec);
    if (ec)
        return false;
    fs::path::iterator i = inner.begin();
    for (fs::path::iterator o = outer.begin(); o != outer.end(); ++o, ++i)
    {
        if (i == inner.end() || *i != *o)
            return false;
    }
    return true;
}

std::string regex_escape(std::string const& s)
{
    static char const special[] = "\\^$.|?*+()[]{}";
    std::string result;
    for (char c : s)
    {
        if (std::char_traits<char>::find(special, sizeof(special) - 1, c))
            result += '\\';
        result += c;
    }
    return result;
}

} // namespace splitrepo
