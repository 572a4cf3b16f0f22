#include "apps/console_report.hpp"

#include <algorithm>
#include <iomanip>
#include <string>

#include "core/node_util.hpp"

namespace scfg {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";

struct Leaf {
  std::string path;
  std::string value;
  std::string range;
};

void PrintConfiguration(std::ostream& os, const Configuration& config) {
  YAML::Emitter out;
  out << config.map();
  os << out.c_str() << "\n";
}

void PrintScalarLeaves(std::ostream& os, const Configuration& config) {
  const auto leaves = ReduceConfigurationSettings(
      config,
      [](const Range& range, const Path& path, std::vector<Leaf> acc, const YAML::Node& value) {
        acc.push_back(Leaf{PathToString(path), NodeToString(value), range.description()});
        return acc;
      },
      std::vector<Leaf>{});

  std::size_t width = 4;
  for (const auto& leaf : leaves) width = std::max(width, leaf.path.size());

  for (const auto& leaf : leaves) {
    os << std::left << std::setw(static_cast<int>(width + 2)) << leaf.path
       << std::setw(24) << leaf.value << "(" << leaf.range << ")\n";
  }
}

void PrintDifferences(std::ostream& os, const std::vector<SettingDifference>& diffs, bool color) {
  if (diffs.empty()) {
    os << "No differences\n";
    return;
  }

  os << std::left << std::setw(32) << "SETTING" << std::setw(24) << "A" << "B\n";
  os << std::string(32 + 24 + 24, '-') << "\n";

  for (const auto& d : diffs) {
    os << std::left << std::setw(32) << PathToString(d.path)
       << (color ? kRed : "") << std::setw(24) << NodeToString(d.value_a) << (color ? kReset : "")
       << (color ? kGreen : "") << NodeToString(d.value_b) << (color ? kReset : "")
       << "\n";
  }
}

} // namespace scfg
