#include "core/schema.hpp"

#include <utility>

#include "core/config_error.hpp"

namespace scfg {

static void CheckKey(const std::string& schema_description, const std::string& key,
                     const std::unordered_map<std::string, std::size_t>& settings,
                     const std::unordered_map<std::string, std::size_t>& sections) {
  if (key == kProfilesKey) {
    Report(FatalKind::SchemaDefinition, "schema", "'profiles' is a reserved key",
           {{"schema", schema_description}});
  }
  if (settings.count(key) != 0 || sections.count(key) != 0) {
    Report(FatalKind::SchemaDefinition, "schema", "duplicate key '" + key + "'",
           {{"schema", schema_description}, {"key", key}});
  }
}

Schema::Schema(std::string description, std::vector<SchemaEntry> entries)
    : description_(std::move(description)) {
  for (auto& entry : entries) {
    if (auto* setting = std::get_if<Setting>(&entry)) {
      CheckKey(description_, setting->key, settings_by_key_, sections_by_key_);
      if (!setting->range) {
        Report(FatalKind::SchemaDefinition, "schema", "setting '" + setting->key + "' has no range",
               {{"schema", description_}});
      }
      settings_by_key_.emplace(setting->key, settings_.size());
      settings_.push_back(std::move(*setting));
    } else {
      auto& section = std::get<Section>(entry);
      CheckKey(description_, section.key, settings_by_key_, sections_by_key_);
      if (!section.schema) {
        Report(FatalKind::SchemaDefinition, "schema", "section '" + section.key + "' has no schema",
               {{"schema", description_}});
      }
      sections_by_key_.emplace(section.key, sections_.size());
      sections_.push_back(std::move(section));
    }
  }
}

const Setting* Schema::find_setting(const std::string& key) const {
  auto it = settings_by_key_.find(key);
  if (it == settings_by_key_.end()) return nullptr;
  return &settings_[it->second];
}

const Section* Schema::find_section(const std::string& key) const {
  auto it = sections_by_key_.find(key);
  if (it == sections_by_key_.end()) return nullptr;
  return &sections_[it->second];
}

Setting MakeSetting(std::string key, std::string description, RangePtr range, bool inherit) {
  return Setting{std::move(key), std::move(description), std::move(range), inherit};
}

Section MakeSection(std::string key, SchemaPtr schema, bool inherit) {
  return Section{std::move(key), std::move(schema), inherit};
}

SchemaPtr MakeSchema(std::string description, std::vector<SchemaEntry> entries) {
  return std::make_shared<const Schema>(std::move(description), std::move(entries));
}

} // namespace scfg
