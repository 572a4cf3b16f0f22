#include "apps/service_schema.hpp"

#include <cstdint>
#include <limits>

#include "core/range_combinators.hpp"

namespace scfg {

static RangePtr LogLevelRange() {
  return OneOfRange({YAML::Node("debug"), YAML::Node("info"), YAML::Node("warn"), YAML::Node("error")},
                    YAML::Node("info"));
}

static RangePtr PortRange(std::int64_t default_port) {
  return IntegerBetweenRange(1, 65535, default_port);
}

static SchemaPtr RetrySchema() {
  return MakeSchema("retry policy",
                    {MakeSetting("attempts", "attempts before giving up", IntegerBetweenRange(1, 100, 3)),
                     MakeSetting("backoff_seconds", "delay between attempts", NumberRange(0.5))});
}

static SchemaPtr DatabaseSchema() {
  return MakeSchema("database connection",
                    {MakeSetting("host", "database host", NonEmptyStringRange("localhost")),
                     MakeSetting("port", "database port", PortRange(5432)),
                     MakeSetting("log_level", "database log level", LogLevelRange()),
                     MakeSetting("pool_size", "connections kept open", IntegerBetweenRange(1, 256, 8))});
}

static SchemaPtr WorkersSchema() {
  return MakeSchema("worker pool",
                    {MakeSetting("count", "number of workers", IntegerBetweenRange(1, 1024, 4)),
                     MakeSetting("log_level", "worker log level", LogLevelRange()),
                     MakeSection("retry", RetrySchema())});
}

SchemaPtr ServiceSchema() {
  static const SchemaPtr schema = MakeSchema(
      "service",
      {MakeSetting("name", "service name", NonEmptyStringRange("service")),
       MakeSetting("port", "listen port", PortRange(8080)),
       MakeSetting("log_level", "log level", LogLevelRange(), true),
       MakeSetting("tags", "free-form labels", SetOfRange(StringRange(""))),
       MakeSetting("limits", "named resource limits",
                   MapOfRange(NonEmptyStringRange(""),
                              IntegerBetweenRange(0, std::numeric_limits<std::int64_t>::max(), 0))),
       MakeSection("database", DatabaseSchema()),
       MakeSection("workers", WorkersSchema())});
  return schema;
}

} // namespace scfg
