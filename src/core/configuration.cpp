#include "core/configuration.hpp"

#include <utility>

#include "core/config_error.hpp"
#include "core/node_util.hpp"
#include "core/normalize.hpp"

namespace scfg {

Configuration::Configuration(YAML::Node map, SchemaPtr schema)
    : map_(std::move(map)), schema_(std::move(schema)) {}

Configuration MakeConfiguration(SchemaPtr schema, const std::vector<std::string>& profile_names,
                                const YAML::Node& config_map) {
  if (!schema) {
    Report(FatalKind::SchemaDefinition, "make-configuration", "no schema given");
  }

  Completion c = NormalizeAndCheck(*schema, profile_names, config_map);
  if (!c.ok()) {
    const RangeError& err = c.error();
    Report(FatalKind::Validation, "make-configuration", err.Describe(),
           {{"path", PathToString(err.path)},
            {"value", NodeToString(err.value)},
            {"range", err.range_description()}});
  }
  return Configuration(YAML::Clone(c.value()), std::move(schema));
}

struct SectionLocation {
  YAML::Node map;
  SchemaPtr schema;
};

// Follows 'sections' through both the schema and the normalized map
static SectionLocation FindSection(const YAML::Node& root, const SchemaPtr& root_schema,
                                   const std::vector<std::string>& sections, const char* source) {
  YAML::Node current = root;
  SchemaPtr schema = root_schema;
  Path walked;

  for (const auto& key : sections) {
    walked.push_back(key);
    const Section* section = schema->find_section(key);
    if (section == nullptr || !HasKey(current, key)) {
      Report(FatalKind::AccessPath, source, "no section at this path",
             {{"path", PathToString(walked)}, {"schema", schema->description()}});
    }
    YAML::Node next = Lookup(current, key);
    current.reset(next);
    schema = section->schema;
  }
  return SectionLocation{current, schema};
}

YAML::Node Access(const Configuration& config, const std::string& setting,
                  const std::vector<std::string>& sections) {
  const SectionLocation loc = FindSection(config.map_, config.schema_, sections, "access");

  if (loc.schema->find_setting(setting) == nullptr || !HasKey(loc.map, setting)) {
    Path full;
    for (const auto& s : sections) full.push_back(s);
    full.push_back(setting);
    Report(FatalKind::AccessPath, "access", "no setting at this path",
           {{"path", PathToString(full)}, {"schema", loc.schema->description()}});
  }
  return YAML::Clone(Lookup(loc.map, setting));
}

YAML::Node AccessSection(const Configuration& config, const std::vector<std::string>& sections) {
  const SectionLocation loc = FindSection(config.map_, config.schema_, sections, "access-section");
  return YAML::Clone(loc.map);
}

Configuration SectionSubconfig(const Configuration& config, const std::vector<std::string>& sections) {
  const SectionLocation loc = FindSection(config.map_, config.schema_, sections, "section-subconfig");
  return Configuration(YAML::Clone(loc.map), loc.schema);
}

static void DiffLevel(const Schema& schema, const Path& path, const YAML::Node& a,
                      const YAML::Node& b, std::vector<SettingDifference>& out) {
  for (const auto& setting : schema.settings()) {
    const YAML::Node va = Lookup(a, setting.key);
    const YAML::Node vb = Lookup(b, setting.key);
    if (!NodesEqual(va, vb)) {
      out.push_back(SettingDifference{PathAppend(path, setting.key), YAML::Clone(va), YAML::Clone(vb)});
    }
  }
  for (const auto& section : schema.sections()) {
    DiffLevel(*section.schema, PathAppend(path, section.key), Lookup(a, section.key),
              Lookup(b, section.key), out);
  }
}

std::vector<SettingDifference> DiffConfigurations(const Schema& schema, const Configuration& a,
                                                  const Configuration& b) {
  std::vector<SettingDifference> out;
  DiffLevel(schema, {}, a.map(), b.map(), out);
  return out;
}

} // namespace scfg
