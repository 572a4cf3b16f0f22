#include "core/normalize.hpp"

#include "core/merge.hpp"
#include "core/node_util.hpp"

namespace scfg {

// erase + emplace: assigning into an existing YAML::Node would rebind the outer level's node
static void Remember(InheritedValues& values, const std::string& key, const YAML::Node& value) {
  values.erase(key);
  values.emplace(key, value);
}

static Completion Mismatch(const Path& path, const YAML::Node& value) {
  return Completion::Failure(RangeError{nullptr, path, value});
}

Completion NormalizeAndCheck(const Schema& schema, const std::vector<std::string>& profile_names,
                             const YAML::Node& config_map, const InheritedValues& inherited,
                             const Path& path) {
  if (!IsNil(config_map) && !config_map.IsMap()) return Mismatch(path, config_map);

  const YAML::Node map =
      IsNil(config_map) ? EmptyMap() : ApplyProfiles(schema, config_map, profile_names, path);

  InheritedValues inherit = inherited;
  std::unordered_map<std::string, YAML::Node> done;
  std::vector<std::string> present_sections;

  // Settings present in the input, and keys the schema does not know
  for (const auto& kv : map) {
    const auto key = KeyString(kv.first);
    if (!key) return Mismatch(PathAppend(path, NodeToString(kv.first)), kv.second);

    const Path slot = PathAppend(path, *key);
    if (const Setting* setting = schema.find_setting(*key)) {
      Completion c = setting->range->complete(slot, kv.second);
      if (!c.ok()) return c;
      done.emplace(*key, c.value());
      if (setting->inherit) Remember(inherit, *key, kv.second);
    } else if (schema.find_section(*key) != nullptr) {
      present_sections.push_back(*key);
    } else {
      return Mismatch(slot, kv.second);
    }
  }

  // Missing settings: inherited raw value, else the range's default
  for (const auto& setting : schema.settings()) {
    if (done.count(setting.key) != 0) continue;

    auto it = inherit.find(setting.key);
    const YAML::Node raw = (it != inherit.end()) ? it->second : YAML::Node();
    Completion c = setting.range->complete(PathAppend(path, setting.key), raw);
    if (!c.ok()) return c;
    done.emplace(setting.key, c.value());
  }

  for (const auto& key : present_sections) {
    const Section* section = schema.find_section(key);
    Completion c = NormalizeAndCheck(*section->schema, profile_names, Lookup(map, key), inherit,
                                     PathAppend(path, key));
    if (!c.ok()) return c;
    done.emplace(key, c.value());
    if (section->inherit) Remember(inherit, key, c.value());
  }

  // Missing sections: inherited completed map, else the section's defaults
  for (const auto& section : schema.sections()) {
    if (done.count(section.key) != 0) continue;

    auto it = inherit.find(section.key);
    if (it != inherit.end()) {
      done.emplace(section.key, it->second);
      continue;
    }
    Completion c = NormalizeAndCheck(*section.schema, profile_names, EmptyMap(), inherit,
                                     PathAppend(path, section.key));
    if (!c.ok()) return c;
    done.emplace(section.key, c.value());
  }

  YAML::Node out = EmptyMap();
  for (const auto& setting : schema.settings()) out[setting.key] = done.at(setting.key);
  for (const auto& section : schema.sections()) out[section.key] = done.at(section.key);
  return Completion::Success(out);
}

namespace {

class SchemaRange : public Range {
public:
  explicit SchemaRange(SchemaPtr schema) : Range(schema->description()), schema_(std::move(schema)) {
    for (const auto& section : schema_->sections()) {
      section_ranges_.push_back(std::make_shared<SchemaRange>(section.schema));
    }
  }

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    return NormalizeAndCheck(*schema_, {}, raw, {}, path);
  }

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    for (const auto& setting : schema_->settings()) {
      setting.range->fold_completed(PathAppend(path, setting.key), visit, Lookup(completed, setting.key));
    }
    const auto& sections = schema_->sections();
    for (std::size_t i = 0; i < sections.size(); ++i) {
      section_ranges_[i]->fold_completed(PathAppend(path, sections[i].key), visit,
                                         Lookup(completed, sections[i].key));
    }
  }

private:
  SchemaPtr schema_;
  std::vector<RangePtr> section_ranges_;
};

} // namespace

RangePtr MakeSchemaRange(SchemaPtr schema) {
  return std::make_shared<SchemaRange>(std::move(schema));
}

} // namespace scfg
