#pragma once
#include "graph.hpp"

#include <shared_mutex>

namespace depgraph {

// Graph за read/write-блокировкой: чтение под shared_lock, запись под
// unique_lock. Все операции можно вызывать из нескольких потоков.
class SyncedGraph final : public GraphInterface {
public:
  explicit SyncedGraph(std::size_t node_capacity = 0,
                       std::size_t edge_capacity = 0);
  explicit SyncedGraph(Graph g);

  SyncedGraph(const SyncedGraph &) = delete;
  SyncedGraph &operator=(const SyncedGraph &) = delete;

  void add_node(NodePtr node,
                const std::vector<std::string> &targets = {}) override;
  void add_nodes(const std::vector<NodePtr> &nodes) override;
  NodePtr get_node(const std::string &name) const override;
  std::vector<NodePtr> get_nodes() const override;
  bool remove_node(const std::string &name) override;

  void add_edge(const std::string &source, const std::string &target) override;
  void add_edge_and_nodes(NodePtr source, NodePtr target) override;
  void add_edge_and_nodes(const std::string &source,
                          const std::string &target) override;
  bool has_edge(const std::string &source,
                const std::string &target) const override;
  bool remove_edge(const std::string &source,
                   const std::string &target) override;

  std::vector<NodePtr> get_dependencies(const std::string &name) const override;
  std::vector<NodePtr> get_dependants(const std::string &name) const override;

  std::size_t node_count() const override;
  std::size_t edge_count() const override;

  std::unique_ptr<GraphInterface> copy() const override;
  std::string to_string() const override;

  // Несинхронизированный снимок текущего состояния.
  Graph snapshot() const;
  std::optional<Graph> get_dependency_graph(const std::string &root) const;

private:
  Graph graph_;
  mutable std::shared_mutex mutex_;
};

} // namespace depgraph
