#pragma once

#include "core/schema.hpp"

/*
  Example schema for a small network service, used by config_check and the tests.

    name       non-empty string, default "service"
    port       integer 1..65535, default 8080
    log_level  one of debug|info|warn|error, default info, inherited by nested sections
    tags       set of strings
    limits     map of string to non-negative integer
    database   section: host, port, log_level, pool_size
    workers    section: count, log_level, retry section (attempts, backoff_seconds)
*/

namespace scfg {

SchemaPtr ServiceSchema();

} // namespace scfg
