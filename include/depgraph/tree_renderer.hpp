#pragma once
#include "graph.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace depgraph {

// ASCII-дерево зависимостей. Каждый вызов render*() это отдельная сессия
// со своим множеством уже выведенных узлов: повторно встреченный узел
// выводится как "&name" без раскрытия зависимостей (циклы, ромбы).
//
//     a
//    |\      a -> b, a -> c
//    V V
//    b  c
class TreeRenderer {
public:
  explicit TreeRenderer(const GraphInterface &graph) : graph_(graph) {}

  // Раскладка рекурсивна, глубина стека равна длине самой длинной цепочки
  // зависимостей от корня. Более длинная цепочка даёт std::runtime_error.
  static constexpr std::size_t kMaxDepth = 2048;

  // root обязан существовать, иначе std::invalid_argument.
  std::vector<std::string> render(const std::string &root);

  // Весь граф: синтетический корень над всеми узлами без зависимых,
  // сам корень в вывод не попадает.
  std::vector<std::string> render_full();

private:
  struct Block {
    std::vector<std::string> rows;
    std::size_t width = 0;
  };

  Block layout(const NodePtr &node, std::size_t depth);
  std::vector<NodePtr> cover_roots() const;

  const GraphInterface &graph_;
  std::unordered_set<std::string> rendered_;
};

// Режет строки шире columns на полосы по columns символов и выводит
// полосы друг под другом через пустую строку. columns == 0: без переноса.
std::vector<std::string> wrap_lines(const std::vector<std::string> &lines,
                                    std::size_t columns);

// Ширина терминала stdout (TIOCGWINSZ, затем $COLUMNS), 0 если неизвестна.
std::size_t terminal_columns();

} // namespace depgraph
