#include <depgraph/util.hpp>

#include <cctype>
#include <xxhash.h>

namespace depgraph {

std::string_view trim(std::string_view s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

// Обходит s слева направо и вызывает hit(i) для каждого вхождения needle
// вне кавычек; hit возвращает false, чтобы остановить обход.
template <typename F>
static void scan_unquoted(std::string_view s, std::string_view needle,
                          size_t pos, F hit) {
  bool quoted = false;
  for (size_t i = pos; i < s.size(); ++i) {
    char c = s[i];
    if (quoted) {
      if (c == '\\') ++i;
      else if (c == '"') quoted = false;
      continue;
    }
    if (s.compare(i, needle.size(), needle) == 0 && !hit(i))
      return;
    if (c == '"') quoted = true;
  }
}

size_t find_unquoted(std::string_view s, std::string_view needle, size_t pos) {
  if (needle.empty())
    return pos <= s.size() ? pos : std::string_view::npos;
  size_t found = std::string_view::npos;
  scan_unquoted(s, needle, pos, [&](size_t i) {
    found = i;
    return false;
  });
  return found;
}

size_t rfind_unquoted(std::string_view s, std::string_view needle) {
  if (needle.empty())
    return s.size();
  size_t found = std::string_view::npos;
  scan_unquoted(s, needle, 0, [&](size_t i) {
    found = i;
    return true;
  });
  return found;
}

std::vector<std::string_view> split(std::string_view s, std::string_view sep) {
  std::vector<std::string_view> out;
  if (sep.empty()) {
    out.push_back(s);
    return out;
  }
  size_t pos = 0;
  for (;;) {
    auto next = find_unquoted(s, sep, pos);
    if (next == std::string_view::npos) {
      out.push_back(s.substr(pos));
      return out;
    }
    out.push_back(s.substr(pos, next - pos));
    pos = next + sep.size();
  }
}

std::string quote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string unquote(std::string_view s) {
  if (s.size() < 2 || s.front() != '"' || s.back() != '"')
    return std::string(s);
  std::string out;
  out.reserve(s.size() - 2);
  for (size_t i = 1; i + 1 < s.size(); ++i) {
    if (s[i] == '\\' && i + 2 < s.size()) ++i;
    out.push_back(s[i]);
  }
  return out;
}

uint64_t pair_hash(std::string_view a, std::string_view b) {
  // хэш первой строки служит seed для второй, без промежуточных аллокаций
  const XXH64_hash_t seed = XXH64(a.data(), a.size(), 0);
  return static_cast<uint64_t>(XXH64(b.data(), b.size(), seed));
}

} // namespace depgraph
