#pragma once

#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/normalize.hpp"
#include "core/path.hpp"
#include "core/schema.hpp"

namespace scfg {

// A validated, fully defaulted configuration. Immutable: map() and the access functions hand
// out deep copies
class Configuration {
public:
  Configuration(const Configuration&) = default;
  // Rebinds instead of assigning through the shared YAML node
  Configuration& operator=(const Configuration& other) {
    map_.reset(other.map_);
    schema_ = other.schema_;
    return *this;
  }

  YAML::Node map() const { return YAML::Clone(map_); }
  const Schema& schema() const { return *schema_; }
  const SchemaPtr& schema_ptr() const { return schema_; }

private:
  Configuration(YAML::Node map, SchemaPtr schema);

  friend Configuration MakeConfiguration(SchemaPtr, const std::vector<std::string>&,
                                         const YAML::Node&);
  friend Configuration SectionSubconfig(const Configuration&, const std::vector<std::string>&);
  friend YAML::Node Access(const Configuration&, const std::string&, const std::vector<std::string>&);
  friend YAML::Node AccessSection(const Configuration&, const std::vector<std::string>&);

  YAML::Node map_;
  SchemaPtr schema_;
};

// Normalizes config_map with the named profiles applied. A RangeError is reported as a fatal
// ConfigurationError (FatalKind::Validation) naming the path, the value and the range
Configuration MakeConfiguration(SchemaPtr schema, const std::vector<std::string>& profile_names,
                                const YAML::Node& config_map);

// Value of 'setting' inside the nested 'sections' (outermost first)
YAML::Node Access(const Configuration& config, const std::string& setting,
                  const std::vector<std::string>& sections = {});

// Map of the nested section named by 'sections' (outermost first)
YAML::Node AccessSection(const Configuration& config, const std::vector<std::string>& sections);

// The nested section as a Configuration of its own schema
Configuration SectionSubconfig(const Configuration& config, const std::vector<std::string>& sections);

// ReduceScalarSettings over the values config already holds; they are not completed again
template <typename Acc, typename Fn>
Acc ReduceConfigurationSettings(const Configuration& config, Fn f, Acc init) {
  const RangePtr range = MakeSchemaRange(config.schema_ptr());
  return FoldCompletedRange(*range, Path{}, std::move(f), std::move(init), config.map());
}

struct SettingDifference {
  Path path;
  YAML::Node value_a;
  YAML::Node value_b;
};

// One entry per setting whose values differ, settings before sections at every level. Sections
// only contribute through their settings
std::vector<SettingDifference> DiffConfigurations(const Schema& schema, const Configuration& a,
                                                  const Configuration& b);

} // namespace scfg
