#include <depgraph/tree_renderer.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <deque>
#include <initializer_list>
#include <stdexcept>

#include <sys/ioctl.h>
#include <unistd.h>

namespace depgraph {

static void rstrip(std::string &s) {
  auto end = s.find_last_not_of(' ');
  s.erase(end == std::string::npos ? 0 : end + 1);
}

// Ставит глиф в первую свободную из позиций.
static void put(std::string &row, std::initializer_list<std::size_t> at,
                char glyph) {
  for (auto i : at) {
    if (i < row.size() && row[i] == ' ') {
      row[i] = glyph;
      return;
    }
  }
}

// ------------------------ Раскладка ------------------------

TreeRenderer::Block TreeRenderer::layout(const NodePtr &node,
                                         std::size_t depth) {
  if (depth > kMaxDepth)
    throw std::runtime_error(fmt::format(
        "render: dependency chain deeper than {} nodes", kMaxDepth));
  const auto &name = node->name();
  std::vector<NodePtr> deps;
  std::string label;
  if (!rendered_.insert(name).second) {
    label = fmt::format(" &{} ", name);
  } else {
    label = fmt::format(" {} ", name);
    deps = graph_.get_dependencies(name);
  }
  if (deps.empty())
    return Block{{label}, label.size()};

  std::vector<Block> children;
  children.reserve(deps.size());
  std::size_t dep_width = 0, height = 0;
  std::vector<std::size_t> mids;
  for (const auto &d : deps) {
    children.push_back(layout(d, depth + 1));
    const auto &c = children.back();
    mids.push_back(dep_width + c.width / 2);
    dep_width += c.width;
    height = std::max(height, c.rows.size());
  }

  // имя по центру над детьми; если оно шире, сдвигаем детей под него
  const std::size_t len = label.size();
  std::size_t shift = 0, field = 0, width = dep_width;
  if (len > dep_width) {
    shift = (len - dep_width) / 2;
    width = len;
  } else {
    field = (dep_width - len) / 2;
  }

  Block b;
  b.width = width;
  b.rows.reserve(height + 3);
  b.rows.emplace_back(width, ' ');
  b.rows[0].replace(field, len, label);

  std::string arrows(width, ' '), heads(width, ' ');
  for (auto mid : mids) {
    auto m = mid + shift;
    if (m < field) { // влево
      put(arrows, {m + 2, m + 1}, '/');
      put(heads, {m + 1, m}, 'V');
    } else if (m < field + len) { // вниз
      put(arrows, {m}, '|');
      put(heads, {m}, 'V');
    } else { // вправо
      put(arrows, {m - 2, m - 1}, '\\');
      put(heads, {m - 1, m}, 'V');
    }
  }
  b.rows.push_back(std::move(arrows));
  b.rows.push_back(std::move(heads));

  for (std::size_t r = 0; r < height; ++r) {
    std::string row(shift, ' ');
    for (const auto &c : children) {
      if (r < c.rows.size())
        row += c.rows[r];
      else
        row.append(c.width, ' ');
    }
    row.resize(width, ' ');
    b.rows.push_back(std::move(row));
  }
  return b;
}

std::vector<std::string> TreeRenderer::render(const std::string &root) {
  auto node = graph_.get_node(root);
  if (!node)
    throw std::invalid_argument(
        fmt::format("render: node {} not present in graph", root));

  rendered_.clear();
  auto rows = layout(node, 1).rows;
  for (auto &r : rows)
    rstrip(r);
  return rows;
}

// ------------------------ Весь граф ------------------------

// Узлы без зависимых плюс по одному узлу из каждого цикла, недостижимого
// из них, в порядке добавления.
std::vector<NodePtr> TreeRenderer::cover_roots() const {
  std::vector<NodePtr> roots;
  std::unordered_set<std::string> seen;
  std::deque<std::string> queue;
  auto visit = [&](const NodePtr &start) {
    roots.push_back(start);
    seen.insert(start->name());
    queue.push_back(start->name());
    while (!queue.empty()) {
      auto n = std::move(queue.front());
      queue.pop_front();
      for (const auto &d : graph_.get_dependencies(n)) {
        if (seen.insert(d->name()).second)
          queue.push_back(d->name());
      }
    }
  };

  auto nodes = graph_.get_nodes();
  for (const auto &n : nodes) {
    if (graph_.get_dependants(n->name()).empty() && !seen.count(n->name()))
      visit(n);
  }
  for (const auto &n : nodes) {
    if (!seen.count(n->name()))
      visit(n);
  }
  return roots;
}

std::vector<std::string> TreeRenderer::render_full() {
  if (graph_.node_count() == 0)
    return {"{empty graph}"};

  std::string root = "_all";
  while (graph_.get_node(root))
    root += '_';

  auto full = graph_.copy();
  for (const auto &n : cover_roots())
    full->add_edge_and_nodes(root, n->name());

  auto rows = TreeRenderer(*full).render(root);
  // строка синтетического корня и две строки стрелок
  rows.erase(rows.begin(), rows.begin() + std::min<std::size_t>(3, rows.size()));

  std::size_t indent = std::string::npos;
  for (const auto &r : rows) {
    auto first = r.find_first_not_of(' ');
    if (first != std::string::npos)
      indent = std::min(indent, first);
  }
  if (indent != std::string::npos && indent > 0) {
    for (auto &r : rows)
      r.erase(0, std::min(indent, r.size()));
  }
  return rows;
}

// ------------------------ Перенос по ширине ------------------------

std::vector<std::string> wrap_lines(const std::vector<std::string> &lines,
                                    std::size_t columns) {
  std::size_t width = 0;
  for (const auto &l : lines)
    width = std::max(width, l.size());
  if (columns == 0 || width <= columns)
    return lines;

  std::vector<std::string> out;
  const std::size_t bands = (width + columns - 1) / columns;
  out.reserve(bands * (lines.size() + 1));
  for (std::size_t k = 0; k < bands; ++k) {
    if (k > 0)
      out.emplace_back();
    for (const auto &l : lines) {
      std::string chunk =
          k * columns < l.size() ? l.substr(k * columns, columns) : "";
      rstrip(chunk);
      out.push_back(std::move(chunk));
    }
  }
  return out;
}

std::size_t terminal_columns() {
  struct winsize ws {};
  if (::isatty(STDOUT_FILENO) && ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 &&
      ws.ws_col > 0)
    return ws.ws_col;
  if (const char *e = std::getenv("COLUMNS")) {
    int c = std::atoi(e);
    if (c > 0)
      return static_cast<std::size_t>(c);
  }
  return 0;
}

} // namespace depgraph
