#pragma once
#include "node.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace depgraph {

// Базовый интерфейс графа зависимостей. Ребро source -> target означает
// «source зависит от target». Повторное добавление ребра ничего не меняет.
class GraphInterface {
public:
  virtual ~GraphInterface() = default;

  // Строгий вариант: все targets уже должны быть в графе,
  // иначе std::invalid_argument и граф не меняется.
  virtual void add_node(NodePtr node,
                        const std::vector<std::string> &targets = {}) = 0;
  virtual void add_nodes(const std::vector<NodePtr> &nodes) = 0;
  virtual NodePtr get_node(const std::string &name) const = 0;
  virtual std::vector<NodePtr> get_nodes() const = 0;
  virtual bool remove_node(const std::string &name) = 0;

  // Строгий вариант: оба конца должны существовать (std::invalid_argument).
  virtual void add_edge(const std::string &source,
                        const std::string &target) = 0;
  // Недостающие концы регистрируются автоматически.
  virtual void add_edge_and_nodes(NodePtr source, NodePtr target) = 0;
  virtual void add_edge_and_nodes(const std::string &source,
                                  const std::string &target) = 0;
  virtual bool has_edge(const std::string &source,
                        const std::string &target) const = 0;
  virtual bool remove_edge(const std::string &source,
                           const std::string &target) = 0;

  virtual std::vector<NodePtr> get_dependencies(const std::string &name) const = 0;
  virtual std::vector<NodePtr> get_dependants(const std::string &name) const = 0;

  virtual std::size_t node_count() const = 0;
  virtual std::size_t edge_count() const = 0;

  virtual std::unique_ptr<GraphInterface> copy() const = 0;
  virtual std::string to_string() const = 0;
};

// Несинхронизированный граф для однопоточных сценариев.
// Узлы хранятся в порядке добавления, рёбра в хэш-множестве (XXH64),
// плюс индексы смежности в обе стороны.
class Graph final : public GraphInterface {
public:
  explicit Graph(std::size_t node_capacity = 0, std::size_t edge_capacity = 0);

  void add_node(NodePtr node,
                const std::vector<std::string> &targets = {}) override;
  void add_nodes(const std::vector<NodePtr> &nodes) override;
  NodePtr get_node(const std::string &name) const override;
  std::vector<NodePtr> get_nodes() const override { return order_; }
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

  std::size_t node_count() const override { return order_.size(); }
  std::size_t edge_count() const override { return edges_.size(); }

  std::unique_ptr<GraphInterface> copy() const override;
  std::string to_string() const override;

  // Подграф, достижимый из root по исходящим рёбрам (BFS).
  // Пустой результат, если root нет в графе.
  std::optional<Graph> get_dependency_graph(const std::string &root) const;

private:
  struct EdgeKey {
    std::string source;
    std::string target;
    bool operator==(const EdgeKey &o) const {
      return source == o.source && target == o.target;
    }
  };
  struct EdgeKeyHash {
    std::size_t operator()(const EdgeKey &e) const;
  };

  const NodePtr &register_node(NodePtr node);
  bool insert_edge(const std::string &source, const std::string &target);
  std::vector<NodePtr> resolve(const std::vector<std::string> &names) const;

  std::unordered_map<std::string, NodePtr> nodes_;
  std::vector<NodePtr> order_;
  std::unordered_set<EdgeKey, EdgeKeyHash> edges_;
  std::unordered_map<std::string, std::vector<std::string>> out_;
  std::unordered_map<std::string, std::vector<std::string>> in_;
};

} // namespace depgraph
