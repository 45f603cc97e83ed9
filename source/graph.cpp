#include <depgraph/graph.hpp>
#include <depgraph/util.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <deque>
#include <stdexcept>

namespace depgraph {

static void erase_value(std::vector<std::string> &v, const std::string &x) {
  v.erase(std::remove(v.begin(), v.end(), x), v.end());
}

std::size_t Graph::EdgeKeyHash::operator()(const EdgeKey &e) const {
  return static_cast<std::size_t>(pair_hash(e.source, e.target));
}

Graph::Graph(std::size_t node_capacity, std::size_t edge_capacity) {
  nodes_.reserve(node_capacity);
  order_.reserve(node_capacity);
  out_.reserve(node_capacity);
  in_.reserve(node_capacity);
  edges_.reserve(edge_capacity);
}

// ------------------------ Узлы ------------------------

const NodePtr &Graph::register_node(NodePtr node) {
  auto [it, inserted] = nodes_.try_emplace(node->name(), node);
  if (inserted)
    order_.push_back(std::move(node));
  return it->second;
}

void Graph::add_node(NodePtr node, const std::vector<std::string> &targets) {
  if (!node)
    throw std::invalid_argument("add_node: node must not be null");
  for (const auto &t : targets) {
    if (t != node->name() && nodes_.find(t) == nodes_.end())
      throw std::invalid_argument(fmt::format(
          "add_node: target node with name {} not present in graph", t));
  }
  const auto &name = register_node(std::move(node))->name();
  for (const auto &t : targets)
    insert_edge(name, t);
}

void Graph::add_nodes(const std::vector<NodePtr> &nodes) {
  for (const auto &n : nodes) {
    if (!n)
      throw std::invalid_argument("add_nodes: node must not be null");
  }
  for (const auto &n : nodes)
    register_node(n);
}

NodePtr Graph::get_node(const std::string &name) const {
  auto it = nodes_.find(name);
  if (it == nodes_.end())
    return nullptr;
  return it->second;
}

bool Graph::remove_node(const std::string &name) {
  auto it = nodes_.find(name);
  if (it == nodes_.end())
    return false;

  auto out = out_.find(name);
  if (out != out_.end()) {
    for (const auto &t : out->second) {
      edges_.erase(EdgeKey{name, t});
      if (t != name)
        erase_value(in_[t], name);
    }
    out_.erase(out);
  }
  auto in = in_.find(name);
  if (in != in_.end()) {
    for (const auto &s : in->second) {
      edges_.erase(EdgeKey{s, name});
      if (s != name)
        erase_value(out_[s], name);
    }
    in_.erase(in);
  }

  order_.erase(std::find(order_.begin(), order_.end(), it->second));
  nodes_.erase(it);
  return true;
}

// ------------------------ Рёбра ------------------------

bool Graph::insert_edge(const std::string &source, const std::string &target) {
  if (!edges_.insert(EdgeKey{source, target}).second)
    return false;
  out_[source].push_back(target);
  in_[target].push_back(source);
  return true;
}

void Graph::add_edge(const std::string &source, const std::string &target) {
  if (nodes_.find(source) == nodes_.end())
    throw std::invalid_argument(fmt::format(
        "add_edge: source node with name {} not present in graph", source));
  if (nodes_.find(target) == nodes_.end())
    throw std::invalid_argument(fmt::format(
        "add_edge: target node with name {} not present in graph", target));
  insert_edge(source, target);
}

void Graph::add_edge_and_nodes(NodePtr source, NodePtr target) {
  if (!source || !target)
    throw std::invalid_argument("add_edge_and_nodes: node must not be null");
  const auto &s = register_node(std::move(source))->name();
  const auto &t = register_node(std::move(target))->name();
  insert_edge(s, t);
}

void Graph::add_edge_and_nodes(const std::string &source,
                               const std::string &target) {
  if (nodes_.find(source) == nodes_.end())
    register_node(make_node(source));
  if (nodes_.find(target) == nodes_.end())
    register_node(make_node(target));
  insert_edge(source, target);
}

bool Graph::has_edge(const std::string &source,
                     const std::string &target) const {
  return edges_.find(EdgeKey{source, target}) != edges_.end();
}

bool Graph::remove_edge(const std::string &source, const std::string &target) {
  if (edges_.erase(EdgeKey{source, target}) == 0)
    return false;
  erase_value(out_[source], target);
  erase_value(in_[target], source);
  return true;
}

std::vector<NodePtr> Graph::resolve(const std::vector<std::string> &names) const {
  std::vector<NodePtr> out;
  out.reserve(names.size());
  for (const auto &n : names)
    out.push_back(nodes_.at(n));
  return out;
}

std::vector<NodePtr> Graph::get_dependencies(const std::string &name) const {
  auto it = out_.find(name);
  if (it == out_.end())
    return {};
  return resolve(it->second);
}

std::vector<NodePtr> Graph::get_dependants(const std::string &name) const {
  auto it = in_.find(name);
  if (it == in_.end())
    return {};
  return resolve(it->second);
}

// ------------------------ Копии и подграфы ------------------------

std::unique_ptr<GraphInterface> Graph::copy() const {
  return std::make_unique<Graph>(*this);
}

std::optional<Graph> Graph::get_dependency_graph(const std::string &root) const {
  auto start = get_node(root);
  if (!start)
    return std::nullopt;

  Graph result;
  result.register_node(start);
  std::deque<std::string> queue{root};
  while (!queue.empty()) {
    auto name = std::move(queue.front());
    queue.pop_front();
    auto it = out_.find(name);
    if (it == out_.end())
      continue;
    for (const auto &t : it->second) {
      // уже добавленный узел повторно не обходим, но ребро в него сохраняем
      if (result.nodes_.find(t) == result.nodes_.end()) {
        result.register_node(nodes_.at(t));
        queue.push_back(t);
      }
      result.insert_edge(name, t);
    }
  }
  return result;
}

std::string Graph::to_string() const {
  if (order_.empty())
    return "{empty graph}";
  std::string s;
  for (const auto &n : order_) {
    auto it = out_.find(n->name());
    if (it == out_.end())
      continue;
    for (const auto &t : it->second)
      s += fmt::format("{} => {}; ", n->name(), t);
  }
  return s;
}

} // namespace depgraph
