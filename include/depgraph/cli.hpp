#pragma once
#include "config.hpp"

#include <optional>
#include <string>
#include <variant>

namespace depgraph {

struct CmdRun {
  Config cfg;
};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdRun, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

// Флаги поверх base (обычно Config::from_env()).
ParseResult parse_cli(int argc, char **argv, Config base = Config{});

} // namespace depgraph
