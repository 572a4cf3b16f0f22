#pragma once
#include <string>

#include <yaml-cpp/yaml.h>

namespace scfg {

// Parses the YAML file at 'path' into a raw configuration map. Throws ConfigurationError
// (FatalKind::LoadFailure) on parse errors or when the document is not a map. An empty
// document gives {}
YAML::Node LoadConfigMapFromYamlFile(const std::string& path);

// Same for YAML text held in memory
YAML::Node LoadConfigMapFromYamlString(const std::string& text);

}
