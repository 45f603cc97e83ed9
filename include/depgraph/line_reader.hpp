#pragma once
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace depgraph {

// Построчное чтение одного или нескольких потоков как единого входа.
// Строка, оканчивающаяся на '\', склеивается со следующей (сам '\' удаляется),
// завершающий '\r' отбрасывается.
class LineReader {
public:
  struct Source {
    std::istream *in;
    std::string name;
  };

  explicit LineReader(std::istream &in, std::string name = "<input>");
  explicit LineReader(std::vector<Source> sources);

  // false: вход исчерпан или произошла ошибка чтения (см. error()).
  bool next(std::string &line);

  bool failed() const { return !error_.empty(); }
  const std::string &error() const { return error_; }
  std::size_t physical_lines() const { return physical_; }

private:
  std::vector<Source> sources_;
  std::size_t current_ = 0;
  std::size_t physical_ = 0;    // по всем источникам
  std::size_t source_line_ = 0; // в текущем источнике, для сообщений
  std::string error_;
};

} // namespace depgraph
