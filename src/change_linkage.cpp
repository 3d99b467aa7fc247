// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "change_linkage.hpp"
#include "log.hpp"

#include <boost/filesystem/operations.hpp>
#include <stdexcept>

namespace fs = boost::filesystem;

namespace splitrepo {

char const* to_string(change_event e)
{
    switch (e)
    {
    case change_event::merge: return "merge";
    case change_event::from_config: return "from_config";
    case change_event::to_config: return "to_config";
    case change_event::removal: return "rm";
    }
    return "unknown";
}

change_linkage::change_linkage()
    : file_name(fs::temp_directory_path() / fs::unique_path("change_ids_%%%%%%"))
    , log(file_name.string().c_str())
{
    if (!log)
        throw std::runtime_error("cannot create " + file_name.generic_string());
}

change_linkage::~change_linkage()
{
    log.close();
    boost::system::error_code ec;
    fs::remove(file_name, ec);
}

void change_linkage::record(repo_pair const& repos, change_event e, std::string const& change_id)
{
    if (change_id.empty())
    {
        Log::debug() << "no Change-Id for " << repos << " " << to_string(e) << std::endl;
        return;
    }
    entries.push_back(entry{repos, e, change_id});
    log << repos.source << '\t' << repos.dest << '\t' << to_string(e)
        << '\t' << change_id << std::endl;
}

std::string change_linkage::lookup(repo_pair const& repos, change_event e) const
{
    for (auto p = entries.rbegin(); p != entries.rend(); ++p)
    {
        if (p->repos == repos && p->event == e)
            return p->change_id;
    }
    return std::string();
}

} // namespace splitrepo
