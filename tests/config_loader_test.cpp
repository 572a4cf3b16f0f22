#include <cstdio>
#include <fstream>
#include <string>

#include "core/config_loader.hpp"
#include "core/node_util.hpp"
#include "test_support.hpp"

using scfg::tests::Require;
using scfg::tests::RequireFatal;
using scfg::tests::Yaml;

namespace {

void TestLoadFromString() {
  const auto map = scfg::LoadConfigMapFromYamlString("port: 9090\ndb:\n  host: x\n");
  Require(scfg::NodesEqual(map, Yaml("{port: 9090, db: {host: x}}")), "block YAML is parsed");

  const auto empty = scfg::LoadConfigMapFromYamlString("");
  Require(empty.IsMap() && empty.size() == 0, "empty document is {}");

  const auto comment = scfg::LoadConfigMapFromYamlString("# nothing here\n");
  Require(comment.IsMap() && comment.size() == 0, "comment-only document is {}");
}

void TestBadDocuments() {
  RequireFatal(scfg::FatalKind::LoadFailure,
               [] { (void)scfg::LoadConfigMapFromYamlString("- a\n- b\n"); }, "sequence at the top level");
  RequireFatal(scfg::FatalKind::LoadFailure,
               [] { (void)scfg::LoadConfigMapFromYamlString("just text"); }, "scalar at the top level");
  RequireFatal(scfg::FatalKind::LoadFailure,
               [] { (void)scfg::LoadConfigMapFromYamlString("port: [1, 2\n"); }, "parse error");
}

void TestLoadFromFile() {
  const std::string path = "config_loader_test.tmp.yaml";
  {
    std::ofstream out(path);
    out << "name: orders\nworkers:\n  count: 8\n";
  }
  const auto map = scfg::LoadConfigMapFromYamlFile(path);
  std::remove(path.c_str());
  Require(scfg::NodesEqual(map, Yaml("{name: orders, workers: {count: 8}}")), "file is parsed");

  try {
    (void)scfg::LoadConfigMapFromYamlFile("does/not/exist.yaml");
  } catch (const scfg::ConfigurationError& e) {
    Require(e.kind() == scfg::FatalKind::LoadFailure, "missing file is a load failure");
    Require(!e.detail("reason").empty(), "the parser's reason is kept");
    return;
  }
  Require(false, "missing file must be reported");
}

} // namespace

int main() {
  return scfg::tests::RunTests({
      {"load_from_string", TestLoadFromString},
      {"bad_documents", TestBadDocuments},
      {"load_from_file", TestLoadFromFile},
  });
}
