#pragma once
#include "graph.hpp"
#include "line_reader.hpp"
#include "synced_graph.hpp"
#include "syntax.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

struct IngestOptions {
  unsigned threads = 0;           // 0: hardware_concurrency()
  std::size_t queue_capacity = 0; // 0: 2 * threads
};

struct IngestResult {
  std::size_t lines = 0;        // логические строки (после склейки)
  std::size_t declarations = 0; // строки, совпавшие с одним из синтаксисов
  std::string error;
  bool ok() const { return error.empty(); }
};

struct Declaration {
  std::string body;
  std::size_t syntax = 0; // индекс в списке синтаксисов
};

// Последовательная часть разбора: отслеживает активные синтаксисы
// (graph_prefix / graph_suffix) и выделяет тело объявления из строки.
class DeclarationScanner {
public:
  explicit DeclarationScanner(const std::vector<Syntax> &syntaxes);

  std::optional<Declaration> scan(std::string_view line);
  bool active(std::size_t i) const { return active_.at(i); }

private:
  const std::vector<Syntax> &syntaxes_;
  std::vector<bool> active_;
};

// Тело объявления для одного синтаксиса, если строка ему соответствует.
std::optional<std::string_view> match_declaration(std::string_view line,
                                                  const Syntax &s);

// Делит тело на источники и цели и добавляет все пары рёбер.
// Возвращает количество пар.
std::size_t add_declaration(std::string_view body, const Syntax &s,
                            GraphInterface &graph);

class Ingestor {
public:
  explicit Ingestor(std::vector<Syntax> syntaxes, IngestOptions opts = {});

  // Частично построенный граф остаётся в graph и при ошибке.
  IngestResult ingest(LineReader &reader, SyncedGraph &graph) const;
  IngestResult ingest(std::istream &in, SyncedGraph &graph) const;
  // "-" означает stdin.
  IngestResult ingest_files(const std::vector<std::filesystem::path> &files,
                            SyncedGraph &graph) const;

  const std::vector<Syntax> &syntaxes() const { return syntaxes_; }

private:
  std::vector<Syntax> syntaxes_;
  IngestOptions opts_;
};

} // namespace depgraph
