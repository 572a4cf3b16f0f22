#include "core/node_util.hpp"

namespace scfg {

bool IsNil(const YAML::Node& node) {
  return !node.IsDefined() || node.IsNull();
}

static bool MapsEqual(const YAML::Node& a, const YAML::Node& b) {
  if (a.size() != b.size()) return false;

  for (const auto& kv : a) {
    bool matched = false;
    for (const auto& other : b) {
      if (NodesEqual(kv.first, other.first)) {
        if (!NodesEqual(kv.second, other.second)) return false;
        matched = true;
        break;
      }
    }
    if (!matched) return false;
  }
  return true;
}

bool NodesEqual(const YAML::Node& a, const YAML::Node& b) {
  const bool a_nil = IsNil(a);
  const bool b_nil = IsNil(b);
  if (a_nil || b_nil) return a_nil && b_nil;

  if (a.Type() != b.Type()) return false;

  switch (a.Type()) {
    case YAML::NodeType::Scalar:
      return a.Scalar() == b.Scalar();
    case YAML::NodeType::Sequence: {
      if (a.size() != b.size()) return false;
      for (std::size_t i = 0; i < a.size(); ++i) {
        if (!NodesEqual(a[i], b[i])) return false;
      }
      return true;
    }
    case YAML::NodeType::Map:
      return MapsEqual(a, b);
    default:
      return false;
  }
}

std::string NodeToString(const YAML::Node& node) {
  if (!node.IsDefined()) return "<undefined>";
  if (node.IsNull()) return "null";

  YAML::Emitter out;
  out << YAML::Flow << node;
  return out.c_str();
}

YAML::Node EmptyMap() {
  return YAML::Node(YAML::NodeType::Map);
}

YAML::Node EmptySequence() {
  return YAML::Node(YAML::NodeType::Sequence);
}

std::optional<std::string> KeyString(const YAML::Node& key) {
  if (!key.IsDefined() || !key.IsScalar()) return std::nullopt;
  return key.Scalar();
}

bool HasKey(const YAML::Node& map, const std::string& key) {
  if (!map.IsDefined() || !map.IsMap()) return false;
  for (const auto& kv : map) {
    const auto k = KeyString(kv.first);
    if (k && *k == key) return true;
  }
  return false;
}

YAML::Node Lookup(const YAML::Node& map, const std::string& key) {
  if (map.IsDefined() && map.IsMap()) {
    for (const auto& kv : map) {
      const auto k = KeyString(kv.first);
      if (k && *k == key) return kv.second;
    }
  }
  return YAML::Node();
}

} // namespace scfg
