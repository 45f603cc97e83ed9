#pragma once

namespace depgraph {

struct App {
  int run(int argc, char **argv);
};

} // namespace depgraph
