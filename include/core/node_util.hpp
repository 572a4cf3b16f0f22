#pragma once

#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

/*
  Helpers over YAML::Node, the value model for raw and completed configuration data.

  YAML::Node has reference semantics: assigning to a Node that already refers to
  data rebinds the shared node, so code here builds fresh nodes and never assigns
  through an existing one.
*/

namespace scfg {

// Undefined (missing key) or an explicit YAML null
bool IsNil(const YAML::Node& node);

// Structural equality. Scalars compare by text, sequences in order, maps by key set
bool NodesEqual(const YAML::Node& a, const YAML::Node& b);

// Single-line flow rendering used in error messages and reports
std::string NodeToString(const YAML::Node& node);

YAML::Node EmptyMap();
YAML::Node EmptySequence();

// Scalar map key as a string, nullopt for non-scalar keys
std::optional<std::string> KeyString(const YAML::Node& key);

// True if 'map' is a map holding 'key' (an explicit null value counts)
bool HasKey(const YAML::Node& map, const std::string& key);

// Value under 'key', or a null node when the key is missing
YAML::Node Lookup(const YAML::Node& map, const std::string& key);

} // namespace scfg
