#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/path.hpp"
#include "core/range.hpp"
#include "core/schema.hpp"

/*
  Normalization turns a raw nested map into a fully defaulted one, guided by the schema.

  At each level: profiles are applied, the settings present are completed through their ranges,
  the missing settings are filled from inherited values or defaults, then the sections present
  are normalized recursively and the missing ones are filled from inherited values or from
  their defaults. The first RangeError anywhere aborts the whole pass and is returned unchanged.

  Inheritance flows outer to inner: an inheritable setting passes its raw value down, an
  inheritable section passes its completed map down.
*/

namespace scfg {

// Values offered to nested levels by inheritable settings and sections, by key
using InheritedValues = std::unordered_map<std::string, YAML::Node>;

Completion NormalizeAndCheck(const Schema& schema, const std::vector<std::string>& profile_names,
                             const YAML::Node& config_map, const InheritedValues& inherited = {},
                             const Path& path = {});

// The whole schema as one Range: complete() normalizes, fold() walks settings then sections
RangePtr MakeSchemaRange(SchemaPtr schema);

// Calls f(range, path, acc, scalar) once per scalar leaf of config_map, in schema order
template <typename Acc, typename Fn>
Acc ReduceScalarSettings(const SchemaPtr& schema, Fn f, Acc init, const YAML::Node& config_map) {
  const RangePtr range = MakeSchemaRange(schema);
  return FoldRange(*range, Path{}, std::move(f), std::move(init), config_map);
}

} // namespace scfg
