#include <depgraph/synced_graph.hpp>

#include <mutex>

namespace depgraph {

using ReadLock = std::shared_lock<std::shared_mutex>;
using WriteLock = std::unique_lock<std::shared_mutex>;

SyncedGraph::SyncedGraph(std::size_t node_capacity, std::size_t edge_capacity)
    : graph_(node_capacity, edge_capacity) {}

SyncedGraph::SyncedGraph(Graph g) : graph_(std::move(g)) {}

void SyncedGraph::add_node(NodePtr node,
                           const std::vector<std::string> &targets) {
  WriteLock lk(mutex_);
  graph_.add_node(std::move(node), targets);
}

void SyncedGraph::add_nodes(const std::vector<NodePtr> &nodes) {
  WriteLock lk(mutex_);
  graph_.add_nodes(nodes);
}

NodePtr SyncedGraph::get_node(const std::string &name) const {
  ReadLock lk(mutex_);
  return graph_.get_node(name);
}

std::vector<NodePtr> SyncedGraph::get_nodes() const {
  ReadLock lk(mutex_);
  return graph_.get_nodes();
}

bool SyncedGraph::remove_node(const std::string &name) {
  WriteLock lk(mutex_);
  return graph_.remove_node(name);
}

void SyncedGraph::add_edge(const std::string &source,
                           const std::string &target) {
  WriteLock lk(mutex_);
  graph_.add_edge(source, target);
}

void SyncedGraph::add_edge_and_nodes(NodePtr source, NodePtr target) {
  WriteLock lk(mutex_);
  graph_.add_edge_and_nodes(std::move(source), std::move(target));
}

void SyncedGraph::add_edge_and_nodes(const std::string &source,
                                     const std::string &target) {
  WriteLock lk(mutex_);
  graph_.add_edge_and_nodes(source, target);
}

bool SyncedGraph::has_edge(const std::string &source,
                           const std::string &target) const {
  ReadLock lk(mutex_);
  return graph_.has_edge(source, target);
}

bool SyncedGraph::remove_edge(const std::string &source,
                              const std::string &target) {
  WriteLock lk(mutex_);
  return graph_.remove_edge(source, target);
}

std::vector<NodePtr>
SyncedGraph::get_dependencies(const std::string &name) const {
  ReadLock lk(mutex_);
  return graph_.get_dependencies(name);
}

std::vector<NodePtr>
SyncedGraph::get_dependants(const std::string &name) const {
  ReadLock lk(mutex_);
  return graph_.get_dependants(name);
}

std::size_t SyncedGraph::node_count() const {
  ReadLock lk(mutex_);
  return graph_.node_count();
}

std::size_t SyncedGraph::edge_count() const {
  ReadLock lk(mutex_);
  return graph_.edge_count();
}

std::unique_ptr<GraphInterface> SyncedGraph::copy() const {
  return std::make_unique<SyncedGraph>(snapshot());
}

std::string SyncedGraph::to_string() const {
  ReadLock lk(mutex_);
  return graph_.to_string();
}

Graph SyncedGraph::snapshot() const {
  ReadLock lk(mutex_);
  return graph_;
}

std::optional<Graph>
SyncedGraph::get_dependency_graph(const std::string &root) const {
  ReadLock lk(mutex_);
  return graph_.get_dependency_graph(root);
}

} // namespace depgraph
