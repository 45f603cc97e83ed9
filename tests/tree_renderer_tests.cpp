#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <depgraph/graph.hpp>
#include <depgraph/tree_renderer.hpp>
#include "level_graph.hpp"

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace depgraph;
using Rows = std::vector<std::string>;

static Graph edges(std::initializer_list<std::pair<const char *, const char *>> list) {
  Graph g;
  for (const auto &e : list)
    g.add_edge_and_nodes(e.first, e.second);
  return g;
}

static std::size_t count_token(const Rows &rows, const std::string &token) {
  std::size_t n = 0;
  for (const auto &r : rows) {
    std::size_t pos = 0;
    while ((pos = r.find(token, pos)) != std::string::npos) {
      bool left = pos == 0 || r[pos - 1] == ' ';
      bool right = pos + token.size() == r.size() || r[pos + token.size()] == ' ';
      if (left && right) ++n;
      pos += token.size();
    }
  }
  return n;
}

TEST_CASE("single dependency goes straight down") {
  auto g = edges({{"a", "b"}});
  REQUIRE(TreeRenderer(g).render("a") == Rows{" a", " |", " V", " b"});
}

TEST_CASE("leaf renders as its label") {
  Graph g;
  g.add_node(make_node("solo"));
  REQUIRE(TreeRenderer(g).render("solo") == Rows{" solo"});
}

TEST_CASE("two and three dependencies") {
  auto two = edges({{"a", "b"}, {"a", "c"}});
  REQUIRE(TreeRenderer(two).render("a") == Rows{"  a", " |\\", " V V", " b  c"});

  auto three = edges({{"a", "b"}, {"a", "c"}, {"a", "d"}});
  REQUIRE(TreeRenderer(three).render("a") ==
          Rows{"    a", "   /|\\", "  V V V", " b  c  d"});
}

TEST_CASE("wide names center their children") {
  auto g = edges({{"alpha", "b"}});
  REQUIRE(TreeRenderer(g).render("alpha") == Rows{" alpha", "   |", "   V", "   b"});
}

TEST_CASE("level graph layout") {
  auto g = make_level_graph(kTestLevels);
  Rows expected{
      "             1",
      "        /         \\",
      "       V           V",
      "     2             3",
      "   /|\\  \\       / | \\   \\",
      "  V V V  V     V  V  V   V",
      " 4  5  6  7  &4  &5  &6  &7",
  };
  REQUIRE(TreeRenderer(g).render("1") == expected);
}

TEST_CASE("shared dependency is expanded once") {
  auto g = edges({{"a", "b"}, {"a", "c"}, {"b", "d"}, {"c", "d"}});
  auto rows = TreeRenderer(g).render("a");
  REQUIRE(rows == Rows{"   a", "   /\\", "  V V", " b  c", " |   |", " V   V", " d  &d"});
  REQUIRE(count_token(rows, "d") == 1);
  REQUIRE(count_token(rows, "&d") == 1);
}

TEST_CASE("cycles terminate with a back reference") {
  SECTION("self loop") {
    auto g = edges({{"a", "a"}});
    REQUIRE(TreeRenderer(g).render("a") == Rows{" a", "  |", "  V", " &a"});
  }
  SECTION("two-node cycle") {
    auto g = edges({{"a", "b"}, {"b", "a"}});
    REQUIRE(TreeRenderer(g).render("a") ==
            Rows{" a", "  |", "  V", " b", "  |", "  V", " &a"});
  }
}

TEST_CASE("each render call starts a fresh session") {
  auto g = edges({{"a", "b"}});
  TreeRenderer r(g);
  auto first = r.render("a");
  REQUIRE(r.render("a") == first);
  REQUIRE(r.render("b") == Rows{" b"});
}

TEST_CASE("missing root throws") {
  auto g = edges({{"a", "b"}});
  REQUIRE_THROWS_AS(TreeRenderer(g).render("zzz"), std::invalid_argument);
}

TEST_CASE("render_full") {
  SECTION("empty graph") {
    Graph g;
    REQUIRE(TreeRenderer(g).render_full() == Rows{"{empty graph}"});
  }
  SECTION("every root is shown and the synthetic root is dropped") {
    auto g = edges({{"a", "b"}, {"x", "y"}});
    REQUIRE(TreeRenderer(g).render_full() == Rows{"a  x", "|  |", "V  V", "b  y"});
  }
  SECTION("pure cycle still gets a root") {
    auto g = edges({{"a", "b"}, {"b", "a"}});
    REQUIRE(TreeRenderer(g).render_full() ==
            Rows{"a", " |", " V", "b", " |", " V", "&a"});
  }
  SECTION("node named like the synthetic root") {
    auto g = edges({{"_all", "b"}});
    auto rows = TreeRenderer(g).render_full();
    REQUIRE(rows == Rows{"_all", " |", " V", " b"});
  }
  SECTION("graph is left untouched") {
    auto g = edges({{"a", "b"}});
    TreeRenderer(g).render_full();
    REQUIRE(g.node_count() == 2);
    REQUIRE(g.get_node("_all") == nullptr);
  }
}

TEST_CASE("wrap_lines cuts into bands") {
  Rows rows{"abcdefgh", "ab", "abcdef  "};
  REQUIRE(wrap_lines(rows, 0) == rows);
  REQUIRE(wrap_lines(rows, 8) == rows);
  REQUIRE(wrap_lines(rows, 3) == Rows{"abc", "ab", "abc",
                                      "",
                                      "def", "", "def",
                                      "",
                                      "gh", "", ""});
}

static Graph chain(std::size_t nodes) {
  Graph g(nodes, nodes);
  for (std::size_t i = 0; i + 1 < nodes; ++i)
    g.add_edge_and_nodes(std::to_string(i), std::to_string(i + 1));
  return g;
}

TEST_CASE("chain depth is bounded") {
  auto ok = chain(TreeRenderer::kMaxDepth);
  auto rows = TreeRenderer(ok).render("0");
  REQUIRE(rows.size() == 1 + 3 * (TreeRenderer::kMaxDepth - 1));
  REQUIRE(rows.back() == " " + std::to_string(TreeRenderer::kMaxDepth - 1));

  auto deep = chain(TreeRenderer::kMaxDepth + 1);
  REQUIRE_THROWS_AS(TreeRenderer(deep).render("0"), std::runtime_error);
}
