#include <depgraph/line_reader.hpp>

#include <fmt/format.h>

namespace depgraph {

LineReader::LineReader(std::istream &in, std::string name)
    : sources_{Source{&in, std::move(name)}} {}

LineReader::LineReader(std::vector<Source> sources)
    : sources_(std::move(sources)) {}

bool LineReader::next(std::string &line) {
  line.clear();
  if (failed())
    return false;

  bool got = false;
  std::string part;
  while (current_ < sources_.size()) {
    auto &src = sources_[current_];
    if (!std::getline(*src.in, part)) {
      if (src.in->bad()) {
        error_ = fmt::format("read error in {} after line {}", src.name,
                             source_line_);
        return false;
      }
      ++current_;
      source_line_ = 0;
      continue;
    }
    ++physical_;
    ++source_line_;
    got = true;
    if (!part.empty() && part.back() == '\r')
      part.pop_back();
    if (!part.empty() && part.back() == '\\') {
      part.pop_back();
      line += part;
      continue;
    }
    line += part;
    return true;
  }
  // продолжение в последней строке входа
  return got;
}

} // namespace depgraph
