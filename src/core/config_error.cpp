#include "core/config_error.hpp"

#include <sstream>

namespace scfg {

const char* FatalKindName(FatalKind kind) {
  switch (kind) {
    case FatalKind::SchemaDefinition: return "schema definition";
    case FatalKind::MergeInput: return "merge input";
    case FatalKind::UnknownKey: return "unknown key";
    case FatalKind::MissingProfile: return "missing profile";
    case FatalKind::AccessPath: return "access path";
    case FatalKind::Validation: return "validation";
    case FatalKind::AlgorithmInvariant: return "algorithm invariant";
    case FatalKind::LoadFailure: return "load failure";
  }
  return "unknown";
}

static std::string FormatWhat(FatalKind kind, const std::string& source, const std::string& message,
                              const std::vector<ReportDetail>& details) {
  std::ostringstream oss;
  oss << "Config error (" << FatalKindName(kind) << ") in " << source << ": " << message;
  for (const auto& d : details) {
    oss << "\n  " << d.name << ": " << d.value;
  }
  return oss.str();
}

ConfigurationError::ConfigurationError(FatalKind kind, std::string source, std::string message,
                                       std::vector<ReportDetail> details)
    : std::runtime_error(FormatWhat(kind, source, message, details)),
      kind_(kind),
      source_(std::move(source)),
      message_(std::move(message)),
      details_(std::move(details)) {}

std::string ConfigurationError::detail(const std::string& name) const {
  for (const auto& d : details_) {
    if (d.name == name) return d.value;
  }
  return "";
}

void Report(FatalKind kind, const std::string& source, const std::string& message,
            std::vector<ReportDetail> details) {
  throw ConfigurationError(kind, source, message, std::move(details));
}

} // namespace scfg
