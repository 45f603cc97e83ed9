#include <depgraph/ingest.hpp>
#include <depgraph/thread_pool.hpp>
#include <depgraph/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace depgraph {

// ------------------------ Выделение объявлений ------------------------

std::optional<std::string_view> match_declaration(std::string_view line,
                                                  const Syntax &s) {
  // все маркеры ищутся вне кавычек;
  // маркеры графа на той же строке в тело не попадают
  if (!s.graph_prefix.empty()) {
    auto gp = find_unquoted(line, s.graph_prefix);
    if (gp != std::string_view::npos)
      line.remove_prefix(gp + s.graph_prefix.size());
  }
  if (!s.graph_suffix.empty()) {
    auto gs = rfind_unquoted(line, s.graph_suffix);
    if (gs != std::string_view::npos)
      line = line.substr(0, gs);
  }

  auto prefix = find_unquoted(line, s.edge_prefix);
  if (prefix == std::string_view::npos)
    return std::nullopt;
  auto begin = prefix + s.edge_prefix.size();

  auto end = rfind_unquoted(line, s.edge_suffix);
  if (end == std::string_view::npos || end < begin)
    return std::nullopt;

  auto body = line.substr(begin, end - begin);
  if (find_unquoted(body, s.edge_infix) == std::string_view::npos)
    return std::nullopt;
  return body;
}

DeclarationScanner::DeclarationScanner(const std::vector<Syntax> &syntaxes)
    : syntaxes_(syntaxes), active_(syntaxes.size(), false) {}

std::optional<Declaration> DeclarationScanner::scan(std::string_view line) {
  for (std::size_t i = 0; i < syntaxes_.size(); ++i) {
    const auto &s = syntaxes_[i];
    if (s.graph_prefix.empty() ||
        find_unquoted(line, s.graph_prefix) != std::string_view::npos) {
      active_[i] = true;
    } else if (!active_[i]) {
      continue;
    }
    // закрывающая строка ещё может содержать объявление
    bool closing = !s.graph_suffix.empty() &&
                   find_unquoted(line, s.graph_suffix) != std::string_view::npos;
    auto body = match_declaration(line, s);
    if (closing)
      active_[i] = false;
    if (body)
      return Declaration{std::string(*body), i};
  }
  return std::nullopt;
}

// ------------------------ Разбиение на рёбра ------------------------

static std::vector<std::string> tokens(std::string_view part,
                                       std::string_view delimiter,
                                       bool strip) {
  std::vector<std::string> out;
  for (auto t : split(part, delimiter)) {
    if (strip)
      t = trim(t);
    if (t.empty())
      continue;
    auto name = unquote(t);
    if (!name.empty())
      out.push_back(std::move(name));
  }
  return out;
}

std::size_t add_declaration(std::string_view body, const Syntax &s,
                            GraphInterface &graph) {
  auto infix = find_unquoted(body, s.edge_infix);
  if (infix == std::string_view::npos)
    return 0;
  auto sources =
      tokens(body.substr(0, infix), s.source_delimiter, s.strip_whitespace);
  auto targets = tokens(body.substr(infix + s.edge_infix.size()),
                        s.target_delimiter, s.strip_whitespace);

  std::size_t n = 0;
  for (const auto &src : sources) {
    for (const auto &tgt : targets) {
      graph.add_edge_and_nodes(src, tgt);
      ++n;
    }
  }
  return n;
}

// ------------------------ Ingestor ------------------------

Ingestor::Ingestor(std::vector<Syntax> syntaxes, IngestOptions opts)
    : syntaxes_(std::move(syntaxes)), opts_(opts) {
  if (syntaxes_.empty())
    throw std::invalid_argument("Ingestor: at least one syntax required");
}

IngestResult Ingestor::ingest(LineReader &reader, SyncedGraph &graph) const {
  IngestResult r{};
  DeclarationScanner scanner(syntaxes_);
  {
    ThreadPool pool(opts_.threads, opts_.queue_capacity);
    spdlog::debug("ingest: {} workers, queue capacity {}, {} syntaxes",
                  pool.size(), pool.queue_capacity(), syntaxes_.size());

    std::string line;
    while (reader.next(line)) {
      ++r.lines;
      auto decl = scanner.scan(line);
      if (!decl)
        continue;
      ++r.declarations;
      const Syntax &syn = syntaxes_[decl->syntax];
      pool.submit([&graph, &syn, body = std::move(decl->body)] {
        add_declaration(body, syn, graph);
      });
    }
    pool.wait_idle();

    if (reader.failed()) {
      r.error = reader.error();
      spdlog::error("ingest aborted: {}", r.error);
    } else if (pool.failures() > 0) {
      r.error = fmt::format("{} ingestion task(s) failed", pool.failures());
    }
  }

  spdlog::info("ingested {} lines, {} declarations: {} nodes, {} edges",
               r.lines, r.declarations, graph.node_count(), graph.edge_count());
  return r;
}

IngestResult Ingestor::ingest(std::istream &in, SyncedGraph &graph) const {
  LineReader reader(in);
  return ingest(reader, graph);
}

IngestResult
Ingestor::ingest_files(const std::vector<fs::path> &files,
                       SyncedGraph &graph) const {
  std::vector<std::unique_ptr<std::ifstream>> owned;
  std::vector<LineReader::Source> sources;
  std::string open_error;

  for (const auto &p : files) {
    if (p == "-") {
      sources.push_back({&std::cin, "<stdin>"});
      continue;
    }
    std::error_code ec;
    if (fs::is_directory(p, ec)) {
      open_error = fmt::format("cannot read {}: is a directory", p.string());
      break;
    }
    auto f = std::make_unique<std::ifstream>(p);
    if (!f->is_open()) {
      open_error = fmt::format("cannot open {}: {}", p.string(),
                               std::strerror(errno));
      break;
    }
    sources.push_back({f.get(), p.string()});
    owned.push_back(std::move(f));
  }

  // файлы до первой ошибки всё равно читаются: частичный результат
  LineReader reader(std::move(sources));
  auto r = ingest(reader, graph);
  if (!open_error.empty()) {
    spdlog::error("{}", open_error);
    if (r.error.empty())
      r.error = open_error;
  }
  return r;
}

} // namespace depgraph
