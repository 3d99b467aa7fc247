// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#define BOOST_TEST_MODULE map_file
#include <boost/test/unit_test.hpp>

#include "errors.hpp"
#include "map_file.hpp"
#include "validate_plan.hpp"

#include <boost/filesystem.hpp>
#include <fstream>
#include <sstream>

namespace fs = boost::filesystem;
using namespace splitrepo;

namespace
{
  plan parse(std::string const& text)
  {
      std::istringstream in(text);
      return parse_map(in, "test.map", "centos");
  }

  // A scratch directory holding a fake source tree, removed afterwards
  struct source_tree
  {
      source_tree()
          : root(fs::temp_directory_path() / fs::unique_path("map_file_test_%%%%%%"))
      {
          fs::create_directories(root / "repoA");
      }

      ~source_tree()
      {
          boost::system::error_code ec;
          fs::remove_all(root, ec);
      }

      std::string repo(std::string const& name) const
      {
          return (root / name).generic_string();
      }

      void mkdir(std::string const& p) const
      {
          fs::create_directories(root / p);
      }

      void touch(std::string const& p) const
      {
          fs::create_directories((root / p).parent_path());
          std::ofstream((root / p).string().c_str()) << "x\n";
      }

      fs::path root;
  };
}

BOOST_AUTO_TEST_CASE(comments_blanks_and_whitespace)
{
    plan const p = parse(
        "# stx/stx-integ|base/foo|stx/new|foo\n"
        "\n"
        "   \n"
        "  # indented comment\n"
        " repoA | base/dhcp-config/ | repoB | dhcp-config \n");

    BOOST_REQUIRE_EQUAL(p.requests().size(), 1u);
    move_request const& r = p.requests()[0];
    BOOST_CHECK_EQUAL(r.source_repo, "repoA");
    BOOST_CHECK_EQUAL(r.source_path, repo_path("base/dhcp-config"));
    BOOST_CHECK_EQUAL(r.dest_repo, "repoB");
    BOOST_CHECK_EQUAL(r.dest_path, repo_path("dhcp-config"));
    BOOST_CHECK_EQUAL(r.line, 5u);
}

BOOST_AUTO_TEST_CASE(every_malformed_line_is_reported)
{
    std::string const text =
        "repoA|foo|repoB|bar\n"
        "repoA|foo|repoB\n"
        "repoA|baz|repoB|baz\n"
        "repoA||repoB|qux\n"
        "repoA|a|repoB|b|c\n";
    try
    {
        parse(text);
        BOOST_ERROR("malformed map accepted");
    }
    catch (malformed_map_error const& e)
    {
        std::vector<std::size_t> const expected = { 2, 4, 5 };
        BOOST_CHECK_EQUAL_COLLECTIONS(
            e.lines().begin(), e.lines().end(), expected.begin(), expected.end());
    }
}

BOOST_AUTO_TEST_CASE(empty_plan_is_an_error)
{
    BOOST_CHECK_THROW(parse(""), configuration_error);
    BOOST_CHECK_THROW(parse("# nothing to do\n\n"), configuration_error);
}

BOOST_AUTO_TEST_CASE(unreadable_map_file)
{
    BOOST_CHECK_THROW(
        parse_map_file("/nonexistent/split-repo/test.map", "centos"), configuration_error);
}

BOOST_AUTO_TEST_CASE(pairs_are_grouped_once)
{
    plan const p = parse(
        "stx/stx-integ|base/centos-release-config|stx/stx-config-files|centos-release-config\n"
        "stx/stx-integ|base/dhcp-config|stx/stx-config-files|dhcp-config\n"
        "stx/stx-integ|utilities/build-info|stx/stx-utilities|utilities/build-info\n"
        "stx/stx-config|pm-qos-mgr|stx/stx-utilities|utilities/pm-qos-mgr\n"
        "stx/stx-integ|base/dhcp-config/centos|stx/stx-config-files|dhcp-config/centos\n");

    BOOST_REQUIRE_EQUAL(p.groups().size(), 3u);

    filter_group const& g = p.groups()[0];
    BOOST_CHECK_EQUAL(g.repos, (repo_pair{"stx/stx-integ", "stx/stx-config-files"}));
    path_set const expected = { "base/centos-release-config", "base/dhcp-config" };
    BOOST_CHECK(g.source_paths == expected);
    BOOST_CHECK_EQUAL(g.mappings.size(), 3u);

    BOOST_REQUIRE_EQUAL(p.destinations().size(), 2u);
    BOOST_CHECK_EQUAL(p.destinations()[0].repo, "stx/stx-config-files");
    destination const* utilities = p.find_destination("stx/stx-utilities");
    BOOST_REQUIRE(utilities);
    std::vector<std::string> const sources = { "stx/stx-integ", "stx/stx-config" };
    BOOST_CHECK_EQUAL_COLLECTIONS(
        utilities->sources.begin(), utilities->sources.end(), sources.begin(), sources.end());

    BOOST_CHECK(p.find_group(repo_pair{"stx/stx-config", "stx/stx-utilities"}));
    BOOST_CHECK(!p.find_group(repo_pair{"stx/stx-utilities", "stx/stx-config"}));

    std::vector<std::string> const repos = {
        "stx/stx-integ", "stx/stx-config", "stx/stx-config-files", "stx/stx-utilities" };
    std::vector<std::string> const actual = p.repositories();
    BOOST_CHECK_EQUAL_COLLECTIONS(actual.begin(), actual.end(), repos.begin(), repos.end());
}

BOOST_AUTO_TEST_CASE(hash_in_repository_name)
{
    plan const p = parse(
        "repo#1|foo|repoB|foo\n"
        "repo|1#foo|repoB|foo2\n");
    BOOST_CHECK_EQUAL(p.groups().size(), 2u);
}

BOOST_AUTO_TEST_CASE(independent_prefix_rules)
{
    plan const p = parse(
        "A|p/x|B|y/x\n"
        "A|p/z|B|y/z\n");

    destination const* b = p.find_destination("B");
    BOOST_REQUIRE(b);
    BOOST_REQUIRE_EQUAL(b->rules.size(), 2u);
    BOOST_CHECK_EQUAL(b->rules[0], rewrite_rule::substitute("p/x", "y/x"));
    BOOST_CHECK_EQUAL(b->rules[1], rewrite_rule::substitute("p/z", "y/z"));

    BOOST_CHECK_EQUAL(b->rules.apply("p/x/main.c"), repo_path("y/x/main.c"));
    BOOST_CHECK_EQUAL(b->rules.apply("p/z/main.c"), repo_path("y/z/main.c"));
    BOOST_CHECK_EQUAL(b->rules.apply("p/w/main.c"), repo_path("p/w/main.c"));
}

BOOST_AUTO_TEST_CASE(root_moves)
{
    plan const p = parse(
        "repoA|.|repoB|sub\n"
        "repoC|tools|repoD|.\n"
        "repoE|.|repoF|.\n");

    BOOST_REQUIRE_EQUAL(p.find_destination("repoB")->rules.size(), 1u);
    BOOST_CHECK_EQUAL(p.find_destination("repoB")->rules[0], rewrite_rule::insert("sub"));
    BOOST_CHECK_EQUAL(p.find_destination("repoB")->rules.apply("README"), repo_path("sub/README"));

    BOOST_REQUIRE_EQUAL(p.find_destination("repoD")->rules.size(), 1u);
    BOOST_CHECK_EQUAL(p.find_destination("repoD")->rules[0], rewrite_rule::strip("tools"));

    BOOST_CHECK(p.find_destination("repoF")->rules.empty());

    // Root moves name no component, so the fixers have nothing to rename
    for (auto const& g : p.groups())
        BOOST_CHECK(g.mappings.empty());
    BOOST_CHECK(p.groups()[0].source_paths.begin()->is_root());
}

BOOST_AUTO_TEST_CASE(self_named_rules)
{
    source_tree t;
    t.mkdir("repoA/base/foo/foo");
    t.mkdir("repoA/base/foo/centos/foo");
    t.touch("repoA/base/foo/centos/foo.spec");
    t.mkdir("repoA/base/same/same");

    plan const p = parse(
        t.repo("repoA") + "|base/foo|" + t.repo("repoB") + "|pkgs/bar\n"
        + t.repo("repoA") + "|base/same|" + t.repo("repoB") + "|same\n");

    rewrite_ruleset const& rules = p.find_destination(t.repo("repoB"))->rules;
    BOOST_REQUIRE_EQUAL(rules.size(), 5u);
    BOOST_CHECK_EQUAL(rules[0], rewrite_rule::substitute("base/foo", "pkgs/bar"));
    BOOST_CHECK_EQUAL(rules[1], rewrite_rule::substitute("pkgs/bar/foo", "pkgs/bar/bar"));
    BOOST_CHECK_EQUAL(rules[2], rewrite_rule::substitute("pkgs/bar/centos/foo", "pkgs/bar/centos/bar"));
    BOOST_CHECK_EQUAL(rules[3], rewrite_rule::rename_file("pkgs/bar/centos/foo.spec", "pkgs/bar/centos/bar.spec"));
    // Same basename: no self-named rules
    BOOST_CHECK_EQUAL(rules[4], rewrite_rule::substitute("base/same", "same"));

    BOOST_CHECK_EQUAL(rules.apply("base/foo/foo/setup.py"), repo_path("pkgs/bar/bar/setup.py"));
    BOOST_CHECK_EQUAL(rules.apply("base/foo/centos/foo.spec"), repo_path("pkgs/bar/centos/bar.spec"));
    BOOST_CHECK_EQUAL(rules.apply("base/foo/centos/foo/patch"), repo_path("pkgs/bar/centos/bar/patch"));
    BOOST_CHECK_EQUAL(rules.apply("base/foo/centos/build_srpm.data"), repo_path("pkgs/bar/centos/build_srpm.data"));

    BOOST_CHECK_NO_THROW(validate_plan(p));
}

BOOST_AUTO_TEST_CASE(validation)
{
    source_tree t;
    t.mkdir("repoA/base/foo");
    t.touch("repoA/README");

    BOOST_CHECK_NO_THROW(validate_plan(parse(
        t.repo("repoA") + "|base/foo|" + t.repo("repoB") + "|foo\n"
        + t.repo("repoA") + "|README|" + t.repo("repoB") + "|README\n")));

    BOOST_CHECK_THROW(validate_plan(parse(
        t.repo("repoA") + "|base/missing|" + t.repo("repoB") + "|foo\n")), precondition_error);

    BOOST_CHECK_THROW(validate_plan(parse(
        t.repo("nowhere") + "|base/foo|" + t.repo("repoB") + "|foo\n")), precondition_error);

    // A missing child is caught even though its parent subsumes it
    BOOST_CHECK_THROW(validate_plan(parse(
        t.repo("repoA") + "|base|" + t.repo("repoB") + "|base\n"
        + t.repo("repoA") + "|base/missing|" + t.repo("repoB") + "|missing\n")), precondition_error);
}
