#include <depgraph/app.hpp>

int main(int argc, char** argv) {
  return depgraph::App{}.run(argc, argv);
}
