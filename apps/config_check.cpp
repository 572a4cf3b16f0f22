#include <iostream>
#include <string>
#include <vector>

#include "apps/console_report.hpp"
#include "apps/service_schema.hpp"
#include "core/config_loader.hpp"
#include "core/configuration.hpp"

// config_check validates a service configuration file against the service schema
// Usage: config_check [config.yaml] [--profile NAME]... [--diff other.yaml] [--leaves]

static void PrintUsage() {
  std::cerr << "usage: config_check [config.yaml] [--profile NAME]... [--diff other.yaml] [--leaves]\n";
}

int main(int argc, char** argv) {
  std::string cfg_path = "configs/dev.yaml";
  std::string diff_path;
  std::vector<std::string> profiles;
  bool leaves = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--profile" && i + 1 < argc) {
      profiles.push_back(argv[++i]);
    } else if (arg == "--diff" && i + 1 < argc) {
      diff_path = argv[++i];
    } else if (arg == "--leaves") {
      leaves = true;
    } else if (!arg.empty() && arg[0] != '-') {
      cfg_path = arg;
    } else {
      PrintUsage();
      return 2;
    }
  }

  try {
    const scfg::SchemaPtr schema = scfg::ServiceSchema();

    const scfg::Configuration cfg =
        scfg::MakeConfiguration(schema, profiles, scfg::LoadConfigMapFromYamlFile(cfg_path));
    std::cout << "Loaded config OK: " << cfg_path << "\n\n";

    if (leaves) {
      scfg::PrintScalarLeaves(std::cout, cfg);
    } else {
      scfg::PrintConfiguration(std::cout, cfg);
    }

    if (!diff_path.empty()) {
      const scfg::Configuration other =
          scfg::MakeConfiguration(schema, profiles, scfg::LoadConfigMapFromYamlFile(diff_path));
      std::cout << "\nDifferences " << cfg_path << " -> " << diff_path << "\n";
      scfg::PrintDifferences(std::cout, scfg::DiffConfigurations(*schema, cfg, other), true);
    }

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
