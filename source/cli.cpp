#include <depgraph/cli.hpp>

#include <charconv>
#include <cstring>
#include <string_view>

namespace depgraph {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

template <typename T>
static bool parse_number(const char *s, T &out) {
  auto [p, ec] = std::from_chars(s, s + std::strlen(s), out);
  return ec == std::errc() && *p == '\0';
}

ParseResult parse_cli(int argc, char **argv, Config base) {
  ParseResult r{};
  CmdRun c{std::move(base)};
  bool only_files = false;

  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    if (only_files || a == "-" || a.empty() || a[0] != '-') {
      c.cfg.files.emplace_back(a);
      continue;
    }
    if (a == "--") {
      only_files = true;
    } else if (a == "--help" || a == "-h") {
      r.cmd = CmdHelp{};
      return r;
    } else if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    } else if ((a == "--syntax" || a == "-s") && has_arg(i, argc)) {
      c.cfg.syntax = argv[++i];
    } else if ((a == "--outfile" || a == "-o") && has_arg(i, argc)) {
      c.cfg.outfile = argv[++i];
    } else if ((a == "--node" || a == "-n") && has_arg(i, argc)) {
      c.cfg.node = argv[++i];
    } else if ((a == "--threads" || a == "-j") && has_arg(i, argc)) {
      if (!parse_number(argv[++i], c.cfg.threads)) {
        r.error = std::string("invalid value for ") + std::string(a) + ": " + argv[i];
        return r;
      }
    } else if ((a == "--width" || a == "-w") && has_arg(i, argc)) {
      if (!parse_number(argv[++i], c.cfg.width)) {
        r.error = std::string("invalid value for ") + std::string(a) + ": " + argv[i];
        return r;
      }
    } else if (a == "--no-wrap") {
      c.cfg.wrap = false;
    } else if (a == "--verbose" || a == "-v") {
      c.cfg.verbose = true;
    } else if (a == "--quiet" || a == "-q") {
      c.cfg.quiet = true;
    } else if (a == "--syntax" || a == "-s" || a == "--outfile" || a == "-o" ||
               a == "--node" || a == "-n" || a == "--threads" || a == "-j" ||
               a == "--width" || a == "-w") {
      r.error = std::string(a) + ": value required";
      return r;
    } else {
      r.error = "unknown option: " + std::string(a);
      return r;
    }
  }

  if (c.cfg.syntax.empty()) {
    r.error = "--syntax must not be empty";
    return r;
  }
  r.cmd = std::move(c);
  return r;
}

} // namespace depgraph
