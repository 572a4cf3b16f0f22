#pragma once

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/path.hpp"
#include "core/schema.hpp"

/*
  Composition of raw configuration maps before validation. Merging is guided by the schema:
  settings are replaced, sections are merged recursively. Keys the schema does not know are a
  programming error here and are reported as fatal (normalization reports the same thing as a
  recoverable RangeError, since there it is bad data).
*/

namespace scfg {

// Deep merge of c1 and c2, c2 wins. nil acts as {}. The result shares no nodes with the inputs
YAML::Node MergeSansProfiles(const Schema& schema, const Path& path, const YAML::Node& c1,
                             const YAML::Node& c2);

// As MergeSansProfiles, with the top-level 'profiles' maps merged by plain key overwrite
YAML::Node MergeConfigMaps(const Schema& schema, const YAML::Node& c1, const YAML::Node& c2);
YAML::Node MergeConfigMaps(const Schema& schema, const std::vector<YAML::Node>& maps);

// Strips 'profiles' from config_map and overlays the named profiles in order, later ones
// winning. Returns config_map unchanged when it has no 'profiles' key. 'path' locates
// config_map when it belongs to a nested section
YAML::Node ApplyProfiles(const Schema& schema, const YAML::Node& config_map,
                         const std::vector<std::string>& profile_names, const Path& path = {});

} // namespace scfg
