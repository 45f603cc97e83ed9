#include <depgraph/graph_writer.hpp>
#include <depgraph/util.hpp>

#include <fmt/format.h>

namespace depgraph {

void write_graph(const GraphInterface &graph, std::ostream &out,
                 const Syntax &syntax) {
  if (!syntax.graph_prefix.empty())
    out << syntax.graph_prefix << '\n';

  for (const auto &node : graph.get_nodes()) {
    auto deps = graph.get_dependencies(node->name());
    if (deps.empty())
      continue;
    const auto head = fmt::format("{}{}{}", syntax.edge_prefix,
                                  quote(node->name()), syntax.edge_infix);
    if (syntax.target_delimiter.empty()) {
      // одна цель на объявление (Dot)
      for (const auto &d : deps)
        out << head << quote(d->name()) << syntax.edge_suffix << '\n';
      continue;
    }
    out << head;
    for (std::size_t i = 0; i < deps.size(); ++i) {
      if (i > 0)
        out << syntax.target_delimiter;
      out << quote(deps[i]->name());
    }
    out << syntax.edge_suffix << '\n';
  }

  if (!syntax.graph_suffix.empty())
    out << syntax.graph_suffix << '\n';
}

void write_dot(const GraphInterface &graph, std::ostream &out) {
  write_graph(graph, out, syntax::dot());
}

} // namespace depgraph
