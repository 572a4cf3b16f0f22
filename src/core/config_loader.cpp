#include "core/config_loader.hpp"

#include "core/config_error.hpp"
#include "core/node_util.hpp"

namespace scfg {

static YAML::Node RequireMapDocument(const YAML::Node& root, const std::string& origin) {
  if (IsNil(root)) return EmptyMap();
  if (!root.IsMap()) {
    Report(FatalKind::LoadFailure, "load", "top level of '" + origin + "' must be a map",
           {{"value", NodeToString(root)}});
  }
  return root;
}

YAML::Node LoadConfigMapFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    Report(FatalKind::LoadFailure, "load", "failed to load YAML file '" + path + "'",
           {{"reason", e.what()}});
  }

  return RequireMapDocument(root, path);
}

YAML::Node LoadConfigMapFromYamlString(const std::string& text) {
  YAML::Node root;

  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    Report(FatalKind::LoadFailure, "load", "failed to parse YAML text", {{"reason", e.what()}});
  }

  return RequireMapDocument(root, "<string>");
}

} // namespace scfg
