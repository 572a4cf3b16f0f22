#include "core/merge.hpp"

#include "core/config_error.hpp"
#include "core/node_util.hpp"

namespace scfg {

static void RequireMapOrNil(const YAML::Node& node, const Path& path, const char* source) {
  if (IsNil(node) || node.IsMap()) return;
  Report(FatalKind::MergeInput, source, "expected a map",
         {{"path", PathToString(path)}, {"value", NodeToString(node)}});
}

static void CollectKeys(const YAML::Node& map, const Path& path, const char* source,
                        std::vector<std::string>& keys) {
  if (IsNil(map)) return;
  for (const auto& kv : map) {
    const auto key = KeyString(kv.first);
    if (!key) {
      Report(FatalKind::UnknownKey, source, "map key is not a scalar",
             {{"path", PathToString(path)}, {"key", NodeToString(kv.first)}});
    }
    bool seen = false;
    for (const auto& k : keys) {
      if (k == *key) {
        seen = true;
        break;
      }
    }
    if (!seen) keys.push_back(*key);
  }
}

// Shallow copy of 'map' without the 'profiles' entry
static YAML::Node WithoutProfiles(const YAML::Node& map) {
  YAML::Node out = EmptyMap();
  if (IsNil(map)) return out;
  for (const auto& kv : map) {
    const auto key = KeyString(kv.first);
    if (key && *key == kProfilesKey) continue;
    out.force_insert(kv.first, kv.second);
  }
  return out;
}

YAML::Node MergeSansProfiles(const Schema& schema, const Path& path, const YAML::Node& c1,
                             const YAML::Node& c2) {
  RequireMapOrNil(c1, path, "merge");
  RequireMapOrNil(c2, path, "merge");

  std::vector<std::string> keys;
  CollectKeys(c1, path, "merge", keys);
  CollectKeys(c2, path, "merge", keys);

  YAML::Node out = EmptyMap();
  for (const auto& key : keys) {
    const Path slot = PathAppend(path, key);

    if (schema.find_setting(key) != nullptr) {
      const YAML::Node value = HasKey(c2, key) ? Lookup(c2, key) : Lookup(c1, key);
      out[key] = YAML::Clone(value);
    } else if (const Section* section = schema.find_section(key)) {
      out[key] = MergeSansProfiles(*section->schema, slot, Lookup(c1, key), Lookup(c2, key));
    } else {
      Report(FatalKind::UnknownKey, "merge", "key is neither a setting nor a section",
             {{"path", PathToString(slot)}, {"schema", schema.description()}});
    }
  }
  return out;
}

YAML::Node MergeConfigMaps(const Schema& schema, const YAML::Node& c1, const YAML::Node& c2) {
  RequireMapOrNil(c1, {}, "merge-config-maps");
  RequireMapOrNil(c2, {}, "merge-config-maps");

  YAML::Node out = MergeSansProfiles(schema, {}, WithoutProfiles(c1), WithoutProfiles(c2));

  if (HasKey(c1, kProfilesKey) || HasKey(c2, kProfilesKey)) {
    const Path profiles_path{std::string(kProfilesKey)};
    const YAML::Node p1 = Lookup(c1, kProfilesKey);
    const YAML::Node p2 = Lookup(c2, kProfilesKey);
    RequireMapOrNil(p1, profiles_path, "merge-config-maps");
    RequireMapOrNil(p2, profiles_path, "merge-config-maps");

    std::vector<std::string> names;
    CollectKeys(p1, profiles_path, "merge-config-maps", names);
    CollectKeys(p2, profiles_path, "merge-config-maps", names);

    YAML::Node profiles = EmptyMap();
    for (const auto& name : names) {
      const YAML::Node body = HasKey(p2, name) ? Lookup(p2, name) : Lookup(p1, name);
      profiles[name] = YAML::Clone(body);
    }
    out[kProfilesKey] = profiles;
  }
  return out;
}

YAML::Node MergeConfigMaps(const Schema& schema, const std::vector<YAML::Node>& maps) {
  if (maps.empty()) return EmptyMap();

  YAML::Node acc = MergeConfigMaps(schema, EmptyMap(), maps.front());
  for (std::size_t i = 1; i < maps.size(); ++i) {
    YAML::Node next = MergeConfigMaps(schema, acc, maps[i]);
    acc.reset(next);
  }
  return acc;
}

YAML::Node ApplyProfiles(const Schema& schema, const YAML::Node& config_map,
                         const std::vector<std::string>& profile_names, const Path& path) {
  if (!HasKey(config_map, kProfilesKey)) return config_map;

  const YAML::Node profiles = Lookup(config_map, kProfilesKey);
  RequireMapOrNil(profiles, PathAppend(path, std::string(kProfilesKey)), "apply-profiles");

  std::vector<YAML::Node> overlays;
  overlays.reserve(profile_names.size());
  for (const auto& name : profile_names) {
    if (!HasKey(profiles, name)) {
      Report(FatalKind::MissingProfile, "apply-profiles", "profile '" + name + "' is not defined",
             {{"path", PathToString(path)}, {"profile", name}});
    }
    overlays.push_back(Lookup(profiles, name));
  }

  YAML::Node acc = WithoutProfiles(config_map);
  for (const auto& overlay : overlays) {
    YAML::Node next = MergeSansProfiles(schema, path, acc, overlay);
    acc.reset(next);
  }
  return acc;
}

} // namespace scfg
