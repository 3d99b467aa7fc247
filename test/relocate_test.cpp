// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include <boost/process.hpp>
#include <boost/filesystem.hpp>
#define BOOST_TEST_MODULE split_repo
#include <boost/test/unit_test.hpp>
#include <boost/test/framework.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fstream>
#include <iostream>
#include <stdlib.h>
#include <boost/preprocessor/repetition/enum_params.hpp>
#include <boost/preprocessor/repetition/enum_trailing_params.hpp>
#include <boost/preprocessor/repetition/enum_binary_params.hpp>
#include <boost/preprocessor/repetition/enum_trailing_binary_params.hpp>
#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/repeat.hpp>
#include <boost/preprocessor/iteration/iterate.hpp>

#include "file_utils.hpp"
#include "git_repository.hpp"
#include "history_filter.hpp"

namespace process = boost::process;
namespace unit_testing = boost::unit_test::framework;
namespace fs = boost::filesystem;
using splitrepo::git_repository;

struct write_file : std::ofstream
{
    template <class T>
    write_file(T const& name) : std::ofstream(fs::path(name).string().c_str()) {}

    using std::ofstream::operator<<;

    std::ostream& operator<<(char const* rhs)
    {
        return *this << std::string(rhs);
    }
};

template <class P>
P as_string(P x) { return x; }

std::string as_string(fs::path x) { return x.generic_string(); }

#define BOOST_PP_ITERATION_LIMITS (0, 5)
#define BOOST_PP_FILENAME_1 "run_sync.hpp"
#include BOOST_PP_ITERATE()

namespace
{
  char const* split_repo_exe()
  {
      BOOST_REQUIRE(unit_testing::master_test_suite().argc > 1);
      return unit_testing::master_test_suite().argv[1];
  }

  std::string git_output(fs::path const& repo, std::vector<std::string> args)
  {
      return git_repository(repo).git_output(std::move(args));
  }

  std::string subject(fs::path const& repo, std::string const& rev = "HEAD")
  {
      return boost::trim_copy(git_output(repo, {"log", "-1", "--pretty=%s", rev}));
  }

  void commit_all(fs::path const& repo, std::string const& message)
  {
      git_repository r(repo);
      r.git_run({"add", "-A", "."});
      r.git_run({"commit", "-q", "-m", message});
  }

  void make_file(fs::path const& p, std::string const& content)
  {
      fs::create_directories(p.parent_path());
      write_file(p) << content;
  }

  // A scratch directory with a stand-in for oslo.tools' filter script
  // that leaves the history alone and logs its arguments.
  struct workspace
  {
      workspace()
          : original(fs::current_path())
          , root(fs::temp_directory_path() / fs::unique_path("split-repo-test-%%%%-%%%%"))
      {
          fs::create_directories(root / "oslo.tools");
          fs::current_path(root);

          fs::path const filter = root / "oslo.tools" / "filter_git_history.sh";
          write_file(filter)
              << "#!/bin/sh\n"
              << "echo \"$@\" >> '" << (root / "filter.log").string() << "'\n";
          fs::permissions(filter, fs::owner_all | fs::group_read | fs::group_exe
                          | fs::others_read | fs::others_exe);

          setenv("OSLO_TOOLS", (root / "oslo.tools").string().c_str(), 1);
          setenv("GIT_AUTHOR_NAME", "Split Tester", 1);
          setenv("GIT_AUTHOR_EMAIL", "tester@example.com", 1);
          setenv("GIT_COMMITTER_NAME", "Split Tester", 1);
          setenv("GIT_COMMITTER_EMAIL", "tester@example.com", 1);
      }

      ~workspace()
      {
          fs::current_path(original);
          boost::system::error_code ec;
          fs::remove_all(root, ec);
      }

      void init_repo(std::string const& name, std::string const& branch) const
      {
          git_repository repo = git_repository::init(name);
          repo.git_run({"symbolic-ref", "HEAD", "refs/heads/" + branch});
      }

      void write_map(std::string const& text) const
      {
          write_file(root / "repo.map") << text;
      }

      std::string filter_log() const
      {
          fs::path const log = root / "filter.log";
          return fs::exists(log) ? splitrepo::read_file(log) : std::string();
      }

      fs::path original;
      fs::path root;
  };
}

BOOST_AUTO_TEST_CASE(move_into_new_repo)
  {
  workspace w;

  std::cerr << "Create source repository" << std::endl;
  w.init_repo("repoA", "master");
  make_file("repoA/foo/README", "This is foo\n");
  make_file("repoA/foo/PKG-INFO", "Metadata-Version: 1.1\nName: foo\nVersion: 1.0\n");
  make_file("repoA/other/keep.txt", "stays behind\n");
  make_file("repoA/centos_pkg_dirs", "foo\nother\n");
  make_file("repoA/centos_iso_image.inc", "# foo\nfoo\nfoo-devel\nfoo-python\nother\n");
  commit_all("repoA", "initial import");

  make_file("repoA/foo/centos/foo.spec",
            "Name: foo\n"
            "Summary: foo package\n"
            "%package -n %{name}-devel\n"
            "%description -n foo-devel\n"
            "%package -n foo-python\n");
  make_file("repoA/foo/centos/build_srpm.data", "SRC_DIR=\"foo\"\nTAR_NAME=foo\n");
  commit_all("repoA", "package foo");

  std::cerr << "Create a repository depending on foo" << std::endl;
  w.init_repo("repoC", "master");
  make_file("repoC/client/centos/client.spec",
            "Name: client\nRequires: foo\nBuildRequires: foo-devel\nRequires: foo-python\n");
  commit_all("repoC", "client");

  w.write_map("# move foo, renaming it\nrepoA|foo|repoB|bar\n");
  BOOST_REQUIRE_EQUAL(run_sync(split_repo_exe(), "-M", "repo.map"), 0);

  BOOST_CHECK(boost::contains(w.filter_log(), "^foo"));

  // The new repository
  BOOST_REQUIRE(fs::is_directory("repoB/.git"));
  BOOST_CHECK(!fs::exists("repoB/repoA.old_repo"));
  BOOST_CHECK_EQUAL(git_repository("repoB").current_branch(), "master");
  BOOST_CHECK(fs::exists("repoB/bar/README"));
  BOOST_CHECK(fs::exists("repoB/bar/centos/bar.spec"));
  BOOST_CHECK(!fs::exists("repoB/bar/centos/foo.spec"));
  BOOST_CHECK(!fs::exists("repoB/foo"));

  std::string const paths = git_output("repoB", {"log", "--name-only", "--pretty=format:"});
  BOOST_CHECK(boost::contains(paths, "bar/README"));
  BOOST_CHECK(!boost::contains(paths, "foo/README"));
  BOOST_CHECK(!boost::contains(paths, "foo/centos"));

  std::string const spec = splitrepo::read_file("repoB/bar/centos/bar.spec");
  BOOST_CHECK(boost::contains(spec, "Name: bar\n"));
  BOOST_CHECK(boost::contains(spec, "Summary: bar package\n"));
  BOOST_CHECK(boost::contains(spec, "%description -n bar-devel\n"));
  BOOST_CHECK(boost::contains(spec, "%package -n bar-python\n"));
  BOOST_CHECK(boost::contains(splitrepo::read_file("repoB/bar/centos/build_srpm.data"), "SRC_DIR=\"bar\"\nTAR_NAME=bar\n"));
  BOOST_CHECK(boost::contains(splitrepo::read_file("repoB/bar/PKG-INFO"), "Name: bar\n"));
  BOOST_CHECK(boost::ends_with(splitrepo::read_file("repoB/centos_pkg_dirs"), "\nbar\n"));
  BOOST_CHECK(boost::ends_with(splitrepo::read_file("repoB/centos_iso_image.inc"), "\n\n# bar\nbar\nbar-devel\nbar-python\n"));
  BOOST_CHECK_EQUAL(subject("repoB"), "Config file changes to add 'bar ' after relocation from 'repoA'");
  BOOST_CHECK(git_output("repoB", {"status", "--porcelain"}).empty());

  // The source repository
  BOOST_CHECK_EQUAL(git_repository("repoA").current_branch(), "work");
  BOOST_CHECK(!fs::exists("repoA/foo"));
  BOOST_CHECK(fs::exists("repoA/other/keep.txt"));
  BOOST_CHECK_EQUAL(splitrepo::read_file("repoA/centos_pkg_dirs"), "other\n");
  BOOST_CHECK_EQUAL(splitrepo::read_file("repoA/centos_iso_image.inc"), "other\n");
  BOOST_CHECK_EQUAL(subject("repoA"), "Subdirectories 'foo ' relocated to repo 'repoB'");
  BOOST_CHECK_EQUAL(subject("repoA", "HEAD~1"), "Config file changes to remove 'foo ' after relocation to 'repoB'");
  BOOST_CHECK_EQUAL(subject("repoA", "master"), "package foo");

  // The dependent repository
  BOOST_CHECK_EQUAL(git_repository("repoC").current_branch(), "work");
  BOOST_CHECK_EQUAL(splitrepo::read_file("repoC/client/centos/client.spec"),
                    "Name: client\nRequires: bar\nBuildRequires: bar-devel\nRequires: bar-python\n");
  BOOST_CHECK_EQUAL(subject("repoC"), "Fix spec's Requires due to rename of package 'foo' to 'bar'");
  }

BOOST_AUTO_TEST_CASE(move_root_into_existing_repo)
  {
  workspace w;

  w.init_repo("repoA", "master");
  make_file("repoA/README", "repo A\n");
  make_file("repoA/src/main.c", "int main() { return 0; }\n");
  commit_all("repoA", "repo A");

  w.init_repo("repoB", "main");
  make_file("repoB/existing.txt", "repo B\n");
  commit_all("repoB", "repo B");
  std::string const main_tip = git_output("repoB", {"rev-parse", "main"});

  w.write_map("repoA|.|repoB|sub\n");
  BOOST_REQUIRE_EQUAL(run_sync(split_repo_exe(), "--map-file", "repo.map"), 0);

  BOOST_CHECK(boost::contains(w.filter_log(), "^."));

  git_repository const b("repoB");
  BOOST_CHECK_EQUAL(b.current_branch(), "work");
  BOOST_CHECK_EQUAL(git_output("repoB", {"rev-parse", "main"}), main_tip);
  BOOST_CHECK(fs::exists("repoB/sub/README"));
  BOOST_CHECK(fs::exists("repoB/sub/src/main.c"));
  BOOST_CHECK(!fs::exists("repoB/README"));

  std::string const files = git_output("repoB", {"ls-tree", "-r", "--name-only", "HEAD"});
  BOOST_CHECK(boost::contains(files, "sub/README"));
  BOOST_CHECK(!boost::starts_with(files, "README"));

  BOOST_CHECK_EQUAL(git_repository("repoA").current_branch(), "work");
  BOOST_CHECK(!fs::exists("repoA/README"));
  BOOST_CHECK_EQUAL(subject("repoA"), "Subdirectories '. ' relocated to repo 'repoB'");
  }

BOOST_AUTO_TEST_CASE(malformed_map_changes_nothing)
  {
  workspace w;
  w.init_repo("repoA", "master");
  make_file("repoA/foo/README", "foo\n");
  commit_all("repoA", "foo");

  w.write_map(
      "repoA|foo|repoB|bar\n"
      "repoA|foo|repoB\n"
      "|foo|repoB|bar\n");
  BOOST_CHECK_EQUAL(run_sync(split_repo_exe(), "-M", "repo.map"), 1);
  BOOST_CHECK(!fs::exists("repoB"));
  BOOST_CHECK_EQUAL(git_repository("repoA").current_branch(), "master");
  BOOST_CHECK(w.filter_log().empty());
  }

BOOST_AUTO_TEST_CASE(missing_source_path_changes_nothing)
  {
  workspace w;
  w.init_repo("repoA", "master");
  make_file("repoA/foo/README", "foo\n");
  commit_all("repoA", "foo");

  w.write_map("repoA|foo|repoB|bar\nrepoA|nope|repoB|nope\n");
  BOOST_CHECK_EQUAL(run_sync(split_repo_exe(), "-M", "repo.map"), 1);
  BOOST_CHECK(!fs::exists("repoB"));

  w.write_map("");
  BOOST_CHECK_EQUAL(run_sync(split_repo_exe(), "-M", "repo.map"), 1);
  BOOST_CHECK_EQUAL(run_sync(split_repo_exe(), "-M", "no-such.map"), 1);
  }

BOOST_AUTO_TEST_CASE(dry_run_changes_nothing)
  {
  workspace w;
  w.init_repo("repoA", "master");
  make_file("repoA/foo/README", "foo\n");
  commit_all("repoA", "foo");

  w.write_map("repoA|foo|repoB|bar\n");
  BOOST_CHECK_EQUAL(run_sync(split_repo_exe(), "-M", "repo.map", "--dry-run"), 0);
  BOOST_CHECK(!fs::exists("repoB"));
  BOOST_CHECK(w.filter_log().empty());
  }

BOOST_AUTO_TEST_CASE(similar_source_names_get_separate_copies)
  {
  BOOST_CHECK_NE(splitrepo::scratch_name("grp/lib"), splitrepo::scratch_name("grp_lib"));
  BOOST_CHECK_NE(splitrepo::scratch_remote_name("grp/lib"), splitrepo::scratch_remote_name("grp_lib"));
  BOOST_CHECK_EQUAL(splitrepo::scratch_name("repoA"), "repoA.old_repo");

  workspace w;
  w.init_repo("grp/lib", "master");
  make_file("grp/lib/foo/README", "foo\n");
  commit_all("grp/lib", "foo");

  w.init_repo("grp_lib", "master");
  make_file("grp_lib/baz/README", "baz\n");
  commit_all("grp_lib", "baz");

  w.write_map("grp/lib|foo|dest|foo\ngrp_lib|baz|dest|baz\n");
  BOOST_REQUIRE_EQUAL(run_sync(split_repo_exe(), "-M", "repo.map", "-n", "trunk"), 0);

  BOOST_CHECK(boost::contains(w.filter_log(), "^foo"));
  BOOST_CHECK(boost::contains(w.filter_log(), "^baz"));

  BOOST_CHECK_EQUAL(git_repository("dest").current_branch(), "trunk");
  BOOST_CHECK(fs::exists("dest/foo/README"));
  BOOST_CHECK(fs::exists("dest/baz/README"));
  BOOST_CHECK(!fs::exists("dest/" + splitrepo::scratch_name("grp/lib")));
  BOOST_CHECK(!fs::exists("dest/" + splitrepo::scratch_name("grp_lib")));

  BOOST_CHECK(!fs::exists("grp/lib/foo"));
  BOOST_CHECK(!fs::exists("grp_lib/baz"));
  }

BOOST_AUTO_TEST_CASE(existing_filtered_copy_is_reused)
  {
  workspace w;
  w.init_repo("repoA", "master");
  make_file("repoA/foo/README", "foo\n");
  commit_all("repoA", "foo");

  w.init_repo("repoB", "master");
  make_file("repoB/existing.txt", "repo B\n");
  commit_all("repoB", "repo B");

  // What an interrupted run leaves behind after filtering
  BOOST_REQUIRE_EQUAL(run_sync("git", "clone", "-q", "repoA", "repoB/repoA.old_repo"), 0);
  git_repository("repoB/repoA.old_repo").git_run({"checkout", "-q", "-b", "work"});

  w.write_map("repoA|foo|repoB|foo\n");
  BOOST_REQUIRE_EQUAL(run_sync(split_repo_exe(), "-M", "repo.map"), 0);

  BOOST_CHECK(w.filter_log().empty());
  BOOST_CHECK(!fs::exists("repoB/repoA.old_repo"));
  BOOST_CHECK_EQUAL(git_repository("repoB").current_branch(), "work");
  BOOST_CHECK(fs::exists("repoB/foo/README"));
  BOOST_CHECK(fs::exists("repoB/existing.txt"));
  BOOST_CHECK(!fs::exists("repoA/foo"));
  }
