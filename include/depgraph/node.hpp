#pragma once
#include <memory>
#include <string>

namespace depgraph {

// Узел графа. Идентичность определяется только именем, name() вызывается
// очень часто, поэтому должен быть дешёвым.
class Node {
public:
  virtual ~Node() = default;
  virtual const std::string &name() const = 0;
};

using NodePtr = std::shared_ptr<const Node>;

class NamedNode final : public Node {
public:
  explicit NamedNode(std::string name) : name_(std::move(name)) {}
  const std::string &name() const override { return name_; }

private:
  std::string name_;
};

inline NodePtr make_node(std::string name) {
  return std::make_shared<NamedNode>(std::move(name));
}

} // namespace depgraph
