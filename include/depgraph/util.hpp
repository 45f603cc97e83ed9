#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

std::string_view trim(std::string_view s);

// Поиск вне кавычек: участки "..." (с экранированием \" и \\) пропускаются,
// незакрытая кавычка тянется до конца строки. npos, если не найдено.
std::size_t find_unquoted(std::string_view s, std::string_view needle,
                          std::size_t pos = 0);
std::size_t rfind_unquoted(std::string_view s, std::string_view needle);

// Пустой разделитель означает «не делить». Разделитель внутри кавычек
// не учитывается.
std::vector<std::string_view> split(std::string_view s, std::string_view sep);

// "name" с экранированием \" и \\ ; unquote делает обратное.
std::string quote(std::string_view s);
std::string unquote(std::string_view s);

// XXH64(b) с seed = XXH64(a).
uint64_t pair_hash(std::string_view a, std::string_view b);

} // namespace depgraph
