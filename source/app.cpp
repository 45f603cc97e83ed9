#include <depgraph/app.hpp>
#include <depgraph/cli.hpp>
#include <depgraph/graph_writer.hpp>
#include <depgraph/ingest.hpp>
#include <depgraph/synced_graph.hpp>
#include <depgraph/syntax.hpp>
#include <depgraph/tree_renderer.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#ifndef DEPGRAPH_VERSION
#define DEPGRAPH_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace depgraph {

static void print_help() {
  std::cout <<
      R"(depgraph - dependency graph viewer for Makefile-like files

Usage:
  depgraph [options] [file...]          (no file or "-": read stdin)

Options:
  -s, --syntax <list>    syntaxes, default "Makefile,Dot"
                         presets: Makefile (make, m), Dot (d), MakeCall (c)
                         custom:  {"graph_prefix","edge_prefix","source_delim",
                                   "infix","target_delim","edge_suffix",
                                   "graph_suffix",true}
  -o, --outfile <path>   write Dot instead of the tree ("stdout" or a file)
  -n, --node <name>      only the dependency graph of <name>
  -j, --threads <n>      ingestion workers (0 = all cores)
  -w, --width <n>        wrap the tree at <n> columns (0 = terminal width)
      --no-wrap          never wrap
  -v, --verbose / -q, --quiet
  -h, --help / --version

Environment: DEPGRAPH_SYNTAX, DEPGRAPH_THREADS
)";
}

static void setup_logging(const Config &cfg) {
  // stdout занят деревом/Dot, логи только в stderr
  auto logger = spdlog::get("depgraph");
  if (!logger)
    logger = spdlog::stderr_color_mt("depgraph");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (cfg.verbose)
    spdlog::set_level(spdlog::level::debug);
  else if (cfg.quiet)
    spdlog::set_level(spdlog::level::warn);
  else
    spdlog::set_level(spdlog::level::info);
}

static bool export_dot(const GraphInterface &g, const std::string &outfile) {
  if (outfile == "stdout") {
    write_dot(g, std::cout);
    return static_cast<bool>(std::cout);
  }
  std::ofstream o(outfile);
  if (!o) {
    spdlog::error("cannot create {}", outfile);
    return false;
  }
  write_dot(g, o);
  o.flush();
  if (!o) {
    spdlog::error("write to {} failed", outfile);
    return false;
  }
  spdlog::info("dot graph written to {}", outfile);
  return true;
}

static int run_graph(const Config &cfg) {
  auto sr = parse_syntaxes(cfg.syntax);
  if (!sr.syntaxes) {
    spdlog::error("invalid --syntax '{}': {}", cfg.syntax, sr.error);
    return 2;
  }
  for (const auto &s : *sr.syntaxes)
    spdlog::debug("syntax {}", to_string(s));

  SyncedGraph graph;
  Ingestor ingestor(std::move(*sr.syntaxes), IngestOptions{cfg.threads, 0});
  IngestResult r;
  if (cfg.files.empty()) {
    r = ingestor.ingest(std::cin, graph);
  } else {
    std::vector<fs::path> paths(cfg.files.begin(), cfg.files.end());
    r = ingestor.ingest_files(paths, graph);
  }
  // при ошибке чтения выводим то, что успели собрать
  int rc = r.ok() ? 0 : 1;
  if (!r.ok())
    spdlog::warn("showing partial graph: {}", r.error);

  std::unique_ptr<GraphInterface> sub;
  const GraphInterface *view = &graph;
  if (!cfg.node.empty()) {
    auto dg = graph.get_dependency_graph(cfg.node);
    if (!dg) {
      spdlog::error("node not found: {}", cfg.node);
      return 1;
    }
    sub = std::make_unique<Graph>(std::move(*dg));
    view = sub.get();
  }

  if (!cfg.outfile.empty())
    return export_dot(*view, cfg.outfile) ? rc : 1;

  TreeRenderer renderer(*view);
  auto lines = cfg.node.empty() ? renderer.render_full()
                                : renderer.render(cfg.node);
  if (cfg.wrap)
    lines = wrap_lines(lines, cfg.width ? cfg.width : terminal_columns());
  for (const auto &l : lines)
    std::cout << l << '\n';
  std::cout.flush();
  return rc;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv, Config::from_env());
  if (!pr.cmd) {
    setup_logging(Config{});
    spdlog::error("{}", pr.error);
    print_help();
    return 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("depgraph {}\n", DEPGRAPH_VERSION);
          return 0;

        } else {
          setup_logging(c.cfg);
          try {
            return run_graph(c.cfg);
          } catch (const std::exception &e) {
            spdlog::error("depgraph failed: {}", e.what());
            return 1;
          }
        }
      },
      *pr.cmd);
}

} // namespace depgraph
