#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "core/range.hpp"

/*
  The schema tree. Settings are the leaves and carry a Range; sections are subtrees and carry
  a nested Schema. An inheritable setting or section set at an outer level becomes the default
  for the entry with the same key at every nested level that does not override it.

  Schemas are built once and shared read-only through SchemaPtr.
*/

namespace scfg {

class Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

struct Setting {
  std::string key;
  std::string description;
  RangePtr range;
  bool inherit = false;
};

struct Section {
  std::string key;
  SchemaPtr schema;
  bool inherit = false;
};

using SchemaEntry = std::variant<Setting, Section>;

// Reserved top-level key holding named profile overlays
inline constexpr const char* kProfilesKey = "profiles";

class Schema {
public:
  // Throws ConfigurationError on duplicate keys, a reserved key, or a missing range/schema
  Schema(std::string description, std::vector<SchemaEntry> entries);

  const std::string& description() const { return description_; }

  // Declaration order
  const std::vector<Setting>& settings() const { return settings_; }
  const std::vector<Section>& sections() const { return sections_; }

  // nullptr when the key is not declared here
  const Setting* find_setting(const std::string& key) const;
  const Section* find_section(const std::string& key) const;

private:
  std::string description_;
  std::vector<Setting> settings_;
  std::vector<Section> sections_;
  std::unordered_map<std::string, std::size_t> settings_by_key_;
  std::unordered_map<std::string, std::size_t> sections_by_key_;
};

Setting MakeSetting(std::string key, std::string description, RangePtr range, bool inherit = false);
Section MakeSection(std::string key, SchemaPtr schema, bool inherit = false);
SchemaPtr MakeSchema(std::string description, std::vector<SchemaEntry> entries);

} // namespace scfg
