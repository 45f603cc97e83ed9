#pragma once
#include "graph.hpp"
#include "syntax.hpp"

#include <ostream>

namespace depgraph {

// Машиночитаемая запись графа в заданном синтаксисе. Пишутся только рёбра:
// узлы без зависимостей и без зависимых теряются.
void write_graph(const GraphInterface &graph, std::ostream &out,
                 const Syntax &syntax);

void write_dot(const GraphInterface &graph, std::ostream &out);

} // namespace depgraph
