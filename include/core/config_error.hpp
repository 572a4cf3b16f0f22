#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/*
  Fatal errors. These cover programming mistakes against a schema the caller
  controls (unknown keys during a merge, a missing profile, a bad access path,
  a malformed schema) and the final rejection of invalid data by
  MakeConfiguration. Recoverable validation failures are RangeError values and
  never go through here.
*/

namespace scfg {

enum class FatalKind {
  SchemaDefinition,
  MergeInput,
  UnknownKey,
  MissingProfile,
  AccessPath,
  Validation,
  AlgorithmInvariant,
  LoadFailure
};

const char* FatalKindName(FatalKind kind);

struct ReportDetail {
  std::string name;
  std::string value;
};

class ConfigurationError : public std::runtime_error {
public:
  ConfigurationError(FatalKind kind, std::string source, std::string message,
                     std::vector<ReportDetail> details);

  FatalKind kind() const { return kind_; }
  const std::string& source() const { return source_; }
  const std::string& message() const { return message_; }
  const std::vector<ReportDetail>& details() const { return details_; }

  // Value of the detail called 'name', empty if absent
  std::string detail(const std::string& name) const;

private:
  FatalKind kind_;
  std::string source_;
  std::string message_;
  std::vector<ReportDetail> details_;
};

// Throws ConfigurationError; 'source' names the operation that failed
[[noreturn]] void Report(FatalKind kind, const std::string& source, const std::string& message,
                         std::vector<ReportDetail> details = {});

} // namespace scfg
