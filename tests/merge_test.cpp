#include <string>
#include <vector>

#include "core/merge.hpp"
#include "core/node_util.hpp"
#include "core/range_combinators.hpp"
#include "test_support.hpp"

using scfg::tests::Require;
using scfg::tests::RequireFatal;
using scfg::tests::Yaml;

namespace {

scfg::SchemaPtr TestSchema() {
  const auto db = scfg::MakeSchema(
      "db", {scfg::MakeSetting("host", "host", scfg::StringRange("")),
             scfg::MakeSetting("port", "port", scfg::IntegerBetweenRange(1, 65535, 5432))});
  return scfg::MakeSchema(
      "app", {scfg::MakeSetting("port", "port", scfg::IntegerBetweenRange(1, 65535, 8080)),
              scfg::MakeSetting("debug", "debug", scfg::DefaultBooleanRange()),
              scfg::MakeSection("db", db)});
}

void TestMergeWithItself() {
  const auto schema = TestSchema();
  const auto c = Yaml("{port: 1, db: {host: a}}");
  const auto merged = scfg::MergeSansProfiles(*schema, {}, c, c);
  Require(scfg::NodesEqual(merged, c), "merging a map with itself gives the map");
}

void TestSecondMapWins() {
  const auto schema = TestSchema();
  const auto merged = scfg::MergeSansProfiles(*schema, {}, Yaml("{port: 1, debug: true, db: {host: a, port: 2}}"),
                                              Yaml("{port: 3, db: {port: 4}}"));
  Require(scfg::NodesEqual(merged, Yaml("{port: 3, debug: true, db: {host: a, port: 4}}")),
          "settings from c2 win, sections merge key by key");
}

void TestExplicitNilWins() {
  const auto schema = TestSchema();
  const auto merged = scfg::MergeSansProfiles(*schema, {}, Yaml("{port: 1}"), Yaml("{port: null}"));
  Require(scfg::HasKey(merged, "port") && scfg::IsNil(scfg::Lookup(merged, "port")),
          "an explicit null in c2 replaces c1's value");
}

void TestMissingSideActsAsEmpty() {
  const auto schema = TestSchema();
  const auto merged = scfg::MergeSansProfiles(*schema, {}, Yaml("{db: {host: a}}"), YAML::Node());
  Require(scfg::NodesEqual(merged, Yaml("{db: {host: a}}")), "nil map acts as {}");

  const auto one_side = scfg::MergeSansProfiles(*schema, {}, Yaml("{port: 9}"), Yaml("{db: {host: b}}"));
  Require(scfg::NodesEqual(one_side, Yaml("{port: 9, db: {host: b}}")), "sections present on one side are kept");
}

void TestResultIsIndependent() {
  const auto schema = TestSchema();
  const auto c2 = Yaml("{port: 5}");
  auto merged = scfg::MergeSansProfiles(*schema, {}, Yaml("{}"), c2);
  merged["port"] = 6;
  Require(c2["port"].as<int>() == 5, "the merge result shares no nodes with its inputs");
}

void TestUnknownKeysAreFatal() {
  const auto schema = TestSchema();
  RequireFatal(scfg::FatalKind::UnknownKey,
               [&schema] { scfg::MergeSansProfiles(*schema, {}, Yaml("{bogus: 1}"), Yaml("{}")); },
               "unknown key in c1");
  RequireFatal(scfg::FatalKind::UnknownKey,
               [&schema] { scfg::MergeSansProfiles(*schema, {}, Yaml("{}"), Yaml("{db: {user: x}}")); },
               "unknown nested key in c2");
}

void TestNonMapInputIsFatal() {
  const auto schema = TestSchema();
  RequireFatal(scfg::FatalKind::MergeInput,
               [&schema] { scfg::MergeSansProfiles(*schema, {}, Yaml("[1, 2]"), Yaml("{}")); },
               "sequence instead of map");
  RequireFatal(scfg::FatalKind::MergeInput,
               [&schema] { scfg::MergeSansProfiles(*schema, {}, Yaml("{db: 5}"), Yaml("{db: {host: a}}")); },
               "scalar where a section map is expected");
}

void TestMergeConfigMapsProfiles() {
  const auto schema = TestSchema();
  const auto c1 = Yaml("{port: 1, profiles: {dev: {port: 2, debug: true}, prod: {port: 80}}}");
  const auto c2 = Yaml("{debug: false, profiles: {dev: {port: 3}, qa: {bogus_is_not_checked: 1}}}");

  const auto merged = scfg::MergeConfigMaps(*schema, c1, c2);
  Require(scfg::NodesEqual(scfg::Lookup(merged, "port"), Yaml("1")), "base keeps c1's port");
  Require(scfg::NodesEqual(scfg::Lookup(merged, "debug"), Yaml("false")), "base takes c2's debug");

  const auto profiles = scfg::Lookup(merged, "profiles");
  Require(scfg::NodesEqual(profiles["dev"], Yaml("{port: 3}")), "profile bodies are overwritten, not merged");
  Require(scfg::NodesEqual(profiles["prod"], Yaml("{port: 80}")), "profiles only in c1 are kept");
  Require(profiles["qa"].IsMap(), "profile bodies are not schema-checked while merging");
}

void TestMergeConfigMapsVariadic() {
  const auto schema = TestSchema();
  const std::vector<YAML::Node> maps = {Yaml("{port: 1, db: {host: a}}"), Yaml("{port: 2}"),
                                        Yaml("{db: {port: 3}}")};
  const auto merged = scfg::MergeConfigMaps(*schema, maps);
  Require(scfg::NodesEqual(merged, Yaml("{port: 2, db: {host: a, port: 3}}")), "maps fold left to right");

  Require(scfg::NodesEqual(scfg::MergeConfigMaps(*schema, std::vector<YAML::Node>{}), Yaml("{}")),
          "no maps give {}");
}

void TestApplyProfiles() {
  const auto schema = TestSchema();
  const auto config = Yaml(
      "{port: 1, debug: false, db: {host: a, port: 2},"
      " profiles: {dev: {debug: true, db: {host: localhost}}, fast: {port: 9, debug: false}}}");

  const auto dev = scfg::ApplyProfiles(*schema, config, {"dev"});
  Require(scfg::NodesEqual(dev, Yaml("{port: 1, debug: true, db: {host: localhost, port: 2}}")),
          "a profile overlays exactly its own keys");

  const auto both = scfg::ApplyProfiles(*schema, config, {"dev", "fast"});
  Require(scfg::NodesEqual(both, Yaml("{port: 9, debug: false, db: {host: localhost, port: 2}}")),
          "later profiles win");

  const auto none = scfg::ApplyProfiles(*schema, config, {});
  Require(!scfg::HasKey(none, "profiles") && scfg::NodesEqual(scfg::Lookup(none, "port"), Yaml("1")),
          "profiles are stripped even when none is requested");

  const auto plain = Yaml("{port: 4}");
  Require(scfg::NodesEqual(scfg::ApplyProfiles(*schema, plain, {"dev"}), plain),
          "a map without profiles is returned unchanged");
}

void TestMissingProfileIsFatal() {
  const auto schema = TestSchema();
  RequireFatal(scfg::FatalKind::MissingProfile,
               [&schema] {
                 scfg::ApplyProfiles(*schema, Yaml("{profiles: {dev: {port: 2}}}"), {"dev", "prod"});
               },
               "requesting an undefined profile");
}

} // namespace

int main() {
  return scfg::tests::RunTests({
      {"merge_with_itself", TestMergeWithItself},
      {"second_map_wins", TestSecondMapWins},
      {"explicit_nil_wins", TestExplicitNilWins},
      {"missing_side_acts_as_empty", TestMissingSideActsAsEmpty},
      {"result_is_independent", TestResultIsIndependent},
      {"unknown_keys_are_fatal", TestUnknownKeysAreFatal},
      {"non_map_input_is_fatal", TestNonMapInputIsFatal},
      {"merge_config_maps_profiles", TestMergeConfigMapsProfiles},
      {"merge_config_maps_variadic", TestMergeConfigMapsVariadic},
      {"apply_profiles", TestApplyProfiles},
      {"missing_profile_is_fatal", TestMissingProfileIsFatal},
  });
}
