#include "core/path.hpp"

#include <sstream>
#include <utility>

namespace scfg {

Path PathAppend(const Path& path, PathElement element) {
  Path out;
  out.reserve(path.size() + 1);
  out.insert(out.end(), path.begin(), path.end());
  out.push_back(std::move(element));
  return out;
}

std::string PathToString(const Path& path) {
  if (path.empty()) return "<root>";

  std::ostringstream oss;
  bool first = true;
  for (const auto& element : path) {
    if (const auto* key = std::get_if<std::string>(&element)) {
      if (!first) oss << '.';
      oss << *key;
    } else {
      oss << '[' << std::get<std::size_t>(element) << ']';
    }
    first = false;
  }
  return oss.str();
}

} // namespace scfg
