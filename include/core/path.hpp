#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

/*
  A Path locates a value inside a nested configuration: setting/section keys and
  sequence indices, outermost first. Validation errors and fold visits both report
  where they happened with one.
*/

namespace scfg {

using PathElement = std::variant<std::string, std::size_t>;
using Path = std::vector<PathElement>;

// Copy of 'path' with 'element' appended
Path PathAppend(const Path& path, PathElement element);

// Renders "db.host", "servers[2].port", or "<root>" for the empty path
std::string PathToString(const Path& path);

} // namespace scfg
