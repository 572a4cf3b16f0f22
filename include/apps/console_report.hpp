#pragma once

#include <ostream>
#include <vector>

#include "core/configuration.hpp"

/*
  Console output for config_check: the normalized configuration as YAML, a flat listing of
  every scalar leaf, and a table of per-setting differences.
*/

namespace scfg {

void PrintConfiguration(std::ostream& os, const Configuration& config);

// One "path  value  (range)" line per scalar leaf, in schema order
void PrintScalarLeaves(std::ostream& os, const Configuration& config);

void PrintDifferences(std::ostream& os, const std::vector<SettingDifference>& diffs, bool color);

} // namespace scfg
