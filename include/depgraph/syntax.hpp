#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

// Поле, которое в данном формате не используется.
inline constexpr char kIgnoreField[] = "";

// Описание того, как одна строка входа кодирует рёбра.
// Предполагается, что каждое объявление записано в одной строке.
struct Syntax {
  std::string graph_prefix;
  std::string edge_prefix;
  std::string source_delimiter;
  std::string edge_infix;
  std::string target_delimiter;
  std::string edge_suffix;
  std::string graph_suffix;
  bool strip_whitespace = true;

  bool operator==(const Syntax &o) const;
  bool operator!=(const Syntax &o) const { return !(*this == o); }
};

namespace syntax {
const Syntax &makefile();
const Syntax &dot();
// $(call DEPEND_ALL,...) и $(call ALL_SPECS,...)
const std::vector<Syntax> &make_call();
} // namespace syntax

struct SyntaxParseResult {
  std::optional<std::vector<Syntax>> syntaxes;
  std::string error;
};

// Makefile
// Makefile,Dot
// Makefile,{"GraphPrefix","EdgePrefix","SourceDelimiter","EdgeInfix","TargetDelimiter","EdgeSuffix","GraphSuffix",true}
SyntaxParseResult parse_syntaxes(std::string_view text);

// Пресет по имени (без учёта регистра); пустой результат, если имя неизвестно.
std::optional<std::vector<Syntax>> find_preset(std::string_view name);

std::string to_string(const Syntax &s);

} // namespace depgraph
