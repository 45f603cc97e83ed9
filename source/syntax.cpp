#include <depgraph/syntax.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace depgraph {

bool Syntax::operator==(const Syntax &o) const {
  return graph_prefix == o.graph_prefix && edge_prefix == o.edge_prefix &&
         source_delimiter == o.source_delimiter &&
         edge_infix == o.edge_infix &&
         target_delimiter == o.target_delimiter &&
         edge_suffix == o.edge_suffix && graph_suffix == o.graph_suffix &&
         strip_whitespace == o.strip_whitespace;
}

namespace syntax {

const Syntax &makefile() {
  static const Syntax s{kIgnoreField, kIgnoreField, " ",  ":",
                        " ",          kIgnoreField, kIgnoreField, true};
  return s;
}

const Syntax &dot() {
  static const Syntax s{"digraph{",   kIgnoreField, kIgnoreField, "->",
                        kIgnoreField, ";",          "}",          true};
  return s;
}

const std::vector<Syntax> &make_call() {
  static const std::vector<Syntax> v{
      {kIgnoreField, "$(call DEPEND_ALL,", kIgnoreField, ",", ",", ")",
       kIgnoreField, true},
      {kIgnoreField, "$(call ALL_SPECS,", ",", "):", " ", kIgnoreField,
       kIgnoreField, true},
  };
  return v;
}

} // namespace syntax

static std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::optional<std::vector<Syntax>> find_preset(std::string_view name) {
  auto n = lower(name);
  if (n == "makefile" || n == "make" || n == "m")
    return std::vector<Syntax>{syntax::makefile()};
  if (n == "dot" || n == "d")
    return std::vector<Syntax>{syntax::dot()};
  if (n == "makecall" || n == "c")
    return syntax::make_call();
  return std::nullopt;
}

static bool is_split_char(char c) {
  return c == ',' || c == '{' || c == '}' || c == '"' || c == '\'';
}

namespace {

// Однопроходный разбор слева направо, точки разбиения: , { } " '
class SelectorParser {
public:
  explicit SelectorParser(std::string_view text) : s_(text) {}

  SyntaxParseResult run() {
    SyntaxParseResult r{};
    std::vector<Syntax> out;
    if (s_.empty()) {
      r.error = "empty syntax selector";
      return r;
    }
    for (;;) {
      std::string err = s_[i_] == '{' ? parse_block(out) : parse_name(out);
      if (!err.empty()) {
        r.error = std::move(err);
        return r;
      }
      if (i_ == s_.size())
        break;
      if (s_[i_] != ',') {
        r.error = fmt::format("expected ',' at position {}", i_);
        return r;
      }
      if (++i_ == s_.size()) {
        r.error = "trailing ',' in syntax selector";
        return r;
      }
    }
    r.syntaxes = std::move(out);
    return r;
  }

private:
  std::string parse_name(std::vector<Syntax> &out) {
    std::size_t start = i_;
    while (i_ < s_.size() && !is_split_char(s_[i_]))
      ++i_;
    std::string_view token = s_.substr(start, i_ - start);
    if (i_ < s_.size()) {
      switch (s_[i_]) {
      case '{':
        return fmt::format(
            "unexpected character(s) before opening bracket: '{}'", token);
      case '}':
        return fmt::format("unmatched '}}' after '{}'", token);
      case '"':
        return fmt::format("unexpected quote after '{}'", token);
      case '\'':
        return "single-quoted fields are not supported";
      default:
        break;
      }
    }
    if (token.empty())
      return "empty syntax name";
    auto preset = find_preset(token);
    if (!preset)
      return fmt::format("invalid syntax name: '{}'", token);
    out.insert(out.end(), preset->begin(), preset->end());
    return {};
  }

  std::string parse_block(std::vector<Syntax> &out) {
    std::vector<std::string> fields;
    std::optional<std::string> flag;
    ++i_; // '{'
    for (;;) {
      if (i_ == s_.size())
        return "unterminated '{' in syntax selector";
      char c = s_[i_];
      if (c == '"') {
        auto end = s_.find('"', i_ + 1);
        if (end == std::string_view::npos)
          return "unterminated quote in syntax selector";
        if (flag)
          return "quoted field after the strip-whitespace flag";
        fields.emplace_back(s_.substr(i_ + 1, end - i_ - 1));
        i_ = end + 1;
      } else if (c == '\'') {
        return "single-quoted fields are not supported";
      } else if (c == ',') {
        ++i_;
      } else if (c == '}') {
        ++i_;
        break;
      } else if (c == '{') {
        return "nested '{' in syntax selector";
      } else {
        std::size_t start = i_;
        while (i_ < s_.size() && !is_split_char(s_[i_]))
          ++i_;
        if (flag)
          return fmt::format("unexpected token '{}' in brackets",
                             s_.substr(start, i_ - start));
        flag = std::string(s_.substr(start, i_ - start));
      }
    }
    if (fields.size() != 7)
      return fmt::format(
          "brackets must contain the 7 quoted syntax fields, got {}",
          fields.size());
    if (!flag)
      return "brackets are missing the strip-whitespace flag";
    auto f = lower(*flag);
    if (f != "true" && f != "false")
      return fmt::format("invalid strip-whitespace flag: '{}'", *flag);

    out.push_back(Syntax{fields[0], fields[1], fields[2], fields[3],
                         fields[4], fields[5], fields[6], f == "true"});
    return {};
  }

  std::string_view s_;
  std::size_t i_ = 0;
};

} // namespace

SyntaxParseResult parse_syntaxes(std::string_view text) {
  return SelectorParser(text).run();
}

std::string to_string(const Syntax &s) {
  return fmt::format(R"({{"{}","{}","{}","{}","{}","{}","{}",{}}})",
                     s.graph_prefix, s.edge_prefix, s.source_delimiter,
                     s.edge_infix, s.target_delimiter, s.edge_suffix,
                     s.graph_suffix, s.strip_whitespace ? "true" : "false");
}

} // namespace depgraph
