#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace depgraph {

struct Config {
  std::string syntax = "Makefile,Dot";
  std::string outfile;            // "stdout" или путь: вывод в Dot вместо дерева
  std::string node;               // корень подграфа; пусто: весь граф
  std::vector<std::string> files; // пусто: stdin
  unsigned threads = 0;           // 0: hardware_concurrency()
  std::size_t width = 0;          // 0: ширина терминала
  bool wrap = true;
  bool verbose = false;
  bool quiet = false;

  // DEPGRAPH_SYNTAX, DEPGRAPH_THREADS
  static Config from_env();
};

} // namespace depgraph
