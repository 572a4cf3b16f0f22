#include "core/range.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "core/config_error.hpp"
#include "core/node_util.hpp"

namespace scfg {

std::string RangeError::range_description() const {
  if (!range) return "value that fits the schema (no setting or section accepts it here)";
  return range->description();
}

std::string RangeError::Describe() const {
  std::ostringstream oss;
  oss << "Config error at '" << PathToString(path) << "': value " << NodeToString(value)
      << " is not a " << range_description();
  return oss.str();
}

Completion::Completion(bool ok, std::optional<YAML::Node> value, std::optional<RangeError> error)
    : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

Completion Completion::Success(YAML::Node value) {
  return Completion(true, std::move(value), std::nullopt);
}

Completion Completion::Failure(RangeError error) {
  return Completion(false, std::nullopt, std::move(error));
}

const YAML::Node& Completion::value() const {
  if (!ok_) {
    throw std::logic_error("Completion has no value: " + error_->Describe());
  }
  return *value_;
}

const RangeError& Completion::error() const {
  if (ok_) {
    throw std::logic_error("Completion holds a value, not an error");
  }
  return *error_;
}

Range::Range(std::string description) : description_(std::move(description)) {}

Completion Range::Reject(const Path& path, const YAML::Node& value) const {
  return Completion::Failure(RangeError{shared_from_this(), path, value});
}

void Range::fold(const Path& path, const ScalarVisitor& visit, const YAML::Node& value) const {
  Completion c = complete(path, value);
  if (!c.ok()) {
    const RangeError& err = c.error();
    Report(FatalKind::AlgorithmInvariant, "fold",
           "value must complete before it is folded",
           {{"path", PathToString(err.path)},
            {"value", NodeToString(err.value)},
            {"range", err.range_description()}});
  }
  fold_completed(path, visit, c.value());
}

namespace {

class ScalarRange : public Range {
public:
  ScalarRange(std::string description, ScalarCompleter completer)
      : Range(std::move(description)), completer_(std::move(completer)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    std::optional<YAML::Node> out = completer_(path, raw);
    if (!out) return Reject(path, raw);
    return Completion::Success(*out);
  }

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    visit(*this, path, completed);
  }

private:
  ScalarCompleter completer_;
};

} // namespace

RangePtr MakeScalarRange(std::string description, ScalarCompleter completer) {
  return std::make_shared<ScalarRange>(std::move(description), std::move(completer));
}

RangePtr AnyRange(YAML::Node default_value) {
  return MakeScalarRange("any value",
                         [default_value](const Path&, const YAML::Node& raw) -> std::optional<YAML::Node> {
                           if (IsNil(raw)) return YAML::Clone(default_value);
                           return raw;
                         });
}

RangePtr NonNilRange() {
  return MakeScalarRange("non-nil value",
                         [](const Path&, const YAML::Node& raw) -> std::optional<YAML::Node> {
                           if (IsNil(raw)) return std::nullopt;
                           return raw;
                         });
}

RangePtr PredicateRange(std::string description, std::function<bool(const YAML::Node&)> pred,
                        YAML::Node default_value) {
  return MakeScalarRange(std::move(description),
                         [pred = std::move(pred), default_value](const Path&, const YAML::Node& raw)
                             -> std::optional<YAML::Node> {
                           if (IsNil(raw)) return YAML::Clone(default_value);
                           if (pred(raw)) return raw;
                           return std::nullopt;
                         });
}

static bool DecodeInteger(const YAML::Node& v, std::int64_t& out) {
  return v.IsScalar() && YAML::convert<std::int64_t>::decode(v, out);
}

RangePtr BooleanRange(bool default_value) {
  const YAML::Node fallback(default_value);
  return MakeScalarRange("boolean",
                         [fallback](const Path&, const YAML::Node& raw) -> std::optional<YAML::Node> {
                           if (IsNil(raw)) return YAML::Clone(fallback);
                           bool b = false;
                           if (!raw.IsScalar() || !YAML::convert<bool>::decode(raw, b)) return std::nullopt;
                           return YAML::Node(b);
                         });
}

RangePtr DefaultBooleanRange() {
  return BooleanRange(false);
}

RangePtr StringRange(std::string default_value) {
  return PredicateRange("string", [](const YAML::Node& v) { return v.IsScalar(); },
                        YAML::Node(default_value));
}

RangePtr DefaultStringRange() {
  return StringRange("");
}

RangePtr NonEmptyStringRange(std::string default_value) {
  return PredicateRange("non-empty string",
                        [](const YAML::Node& v) { return v.IsScalar() && !v.Scalar().empty(); },
                        YAML::Node(default_value));
}

static RangePtr BoundedIntegerRange(std::string description, std::int64_t min, std::int64_t max,
                                    std::int64_t default_value) {
  const YAML::Node fallback(default_value);
  return MakeScalarRange(std::move(description),
                         [min, max, fallback](const Path&, const YAML::Node& raw) -> std::optional<YAML::Node> {
                           if (IsNil(raw)) return YAML::Clone(fallback);
                           std::int64_t i = 0;
                           if (!DecodeInteger(raw, i) || i < min || i > max) return std::nullopt;
                           return YAML::Node(i);
                         });
}

RangePtr IntegerRange(std::int64_t default_value) {
  return BoundedIntegerRange("integer", std::numeric_limits<std::int64_t>::min(),
                             std::numeric_limits<std::int64_t>::max(), default_value);
}

RangePtr IntegerBetweenRange(std::int64_t min, std::int64_t max, std::int64_t default_value) {
  std::ostringstream desc;
  desc << "integer between " << min << " and " << max;
  return BoundedIntegerRange(desc.str(), min, max, default_value);
}

RangePtr NumberRange(double default_value) {
  return PredicateRange("number",
                        [](const YAML::Node& v) {
                          double d = 0.0;
                          return v.IsScalar() && YAML::convert<double>::decode(v, d) && !std::isnan(d);
                        },
                        YAML::Node(default_value));
}

} // namespace scfg
