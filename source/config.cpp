#include <depgraph/config.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace depgraph {

Config Config::from_env() {
  Config cfg;
  if (const char* e = std::getenv("DEPGRAPH_SYNTAX"); e && *e) cfg.syntax = e;
  if (const char* e = std::getenv("DEPGRAPH_THREADS"); e && *e) {
    unsigned v = 0;
    auto [p, ec] = std::from_chars(e, e + std::strlen(e), v);
    if (ec == std::errc() && *p == '\0') cfg.threads = v;
    else spdlog::warn("ignoring invalid DEPGRAPH_THREADS={}", e);
  }
  return cfg;
}

} // namespace depgraph
