#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <depgraph/app.hpp>
#include <depgraph/cli.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace depgraph;
namespace fs = std::filesystem;

static ParseResult parse(std::vector<std::string> args, Config base = Config{}) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args) argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data(), std::move(base));
}

static int run_app(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args) argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return App{}.run(static_cast<int>(args.size()), argv.data());
}

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("depgraph_cli_") + name);
  fs::create_directories(d);
  return d;
}

static std::string slurp(const fs::path &p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST_CASE("defaults") {
  auto r = parse({"depgraph"});
  REQUIRE(r.cmd.has_value());
  auto *run = std::get_if<CmdRun>(&*r.cmd);
  REQUIRE(run != nullptr);
  REQUIRE(run->cfg.syntax == "Makefile,Dot");
  REQUIRE(run->cfg.files.empty());
  REQUIRE(run->cfg.outfile.empty());
  REQUIRE(run->cfg.node.empty());
  REQUIRE(run->cfg.wrap);
}

TEST_CASE("options and files") {
  auto r = parse({"depgraph", "-s", "Dot", "--node", "app", "-o", "out.dot",
                  "-j", "3", "--width", "100", "--no-wrap", "-v",
                  "a.mk", "-", "--", "-weird.mk"});
  REQUIRE(r.error.empty());
  auto &c = std::get<CmdRun>(*r.cmd).cfg;
  REQUIRE(c.syntax == "Dot");
  REQUIRE(c.node == "app");
  REQUIRE(c.outfile == "out.dot");
  REQUIRE(c.threads == 3);
  REQUIRE(c.width == 100);
  REQUIRE_FALSE(c.wrap);
  REQUIRE(c.verbose);
  REQUIRE(c.files == std::vector<std::string>{"a.mk", "-", "-weird.mk"});
}

TEST_CASE("help and version") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"depgraph", "-h"}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"depgraph", "x.mk", "--help"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"depgraph", "--version"}).cmd));
}

TEST_CASE("cli errors") {
  auto r = parse({"depgraph", "--bogus"});
  REQUIRE_FALSE(r.cmd.has_value());
  REQUIRE(r.error == "unknown option: --bogus");

  r = parse({"depgraph", "--node"});
  REQUIRE(r.error == "--node: value required");

  r = parse({"depgraph", "-j", "many"});
  REQUIRE(r.error == "invalid value for -j: many");

  r = parse({"depgraph", "--width", "-5"});
  REQUIRE(r.error == "invalid value for --width: -5");

  r = parse({"depgraph", "--syntax", ""});
  REQUIRE(r.error == "--syntax must not be empty");
}

TEST_CASE("flags override the base config") {
  Config base;
  base.syntax = "MakeCall";
  base.threads = 5;
  auto r = parse({"depgraph"}, base);
  REQUIRE(std::get<CmdRun>(*r.cmd).cfg.syntax == "MakeCall");
  REQUIRE(std::get<CmdRun>(*r.cmd).cfg.threads == 5);

  r = parse({"depgraph", "-s", "Dot"}, base);
  REQUIRE(std::get<CmdRun>(*r.cmd).cfg.syntax == "Dot");
}

TEST_CASE("environment feeds the base config") {
  ::setenv("DEPGRAPH_SYNTAX", "Dot", 1);
  ::setenv("DEPGRAPH_THREADS", "2", 1);
  auto cfg = Config::from_env();
  REQUIRE(cfg.syntax == "Dot");
  REQUIRE(cfg.threads == 2);

  ::setenv("DEPGRAPH_THREADS", "two", 1);
  REQUIRE(Config::from_env().threads == 0);
  ::unsetenv("DEPGRAPH_SYNTAX");
  ::unsetenv("DEPGRAPH_THREADS");
  REQUIRE(Config::from_env().syntax == "Makefile,Dot");
}

TEST_CASE("app exports the dependency graph of a node") {
  auto dir = mkd("export");
  auto mk = dir / "deps.mk";
  auto out = dir / "out.dot";
  {
    std::ofstream o(mk);
    o << "all: app lib\napp: lib\nlib: core\nother: thing\n";
  }

  REQUIRE(run_app({"depgraph", "-q", "-n", "app", "-o", out.string(), mk.string()}) == 0);
  REQUIRE(slurp(out) == "digraph{\n\"app\"->\"lib\";\n\"lib\"->\"core\";\n}\n");

  SECTION("unknown node") {
    REQUIRE(run_app({"depgraph", "-q", "-n", "nope", "-o", out.string(), mk.string()}) == 1);
  }
  SECTION("missing input file still writes the partial graph") {
    auto missing = dir / "missing.mk";
    REQUIRE(run_app({"depgraph", "-q", "-o", out.string(), mk.string(), missing.string()}) == 1);
    REQUIRE(slurp(out).find("\"other\"->\"thing\";") != std::string::npos);
  }
  SECTION("bad syntax selector") {
    REQUIRE(run_app({"depgraph", "-q", "-s", "Nope", mk.string()}) == 2);
  }
  SECTION("bad option") {
    REQUIRE(run_app({"depgraph", "--bogus"}) == 2);
  }
  fs::remove_all(dir);
}
