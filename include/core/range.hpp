#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "core/path.hpp"

/*
  A Range describes the admissible values of one configuration slot. It has two operations:

    complete(path, raw)  - validate a raw value and fill in defaults, returning either the
                           completed value or a RangeError naming the range that rejected it
    fold(path, visit, v) - complete v, then call visit once per scalar leaf, left to right

  fold() completes exactly once, at the top. Composite ranges pass the completed parts to
  their children through fold_completed(), which never completes again: a completed value
  need not be valid input (RangeMap output is not).

  Ranges are immutable and shared through RangePtr. Composite ranges (sequence-of, map-of,
  ...) wrap other ranges; see range_combinators.hpp. Always create ranges with std::make_shared
  (the factory functions do) since errors keep a reference to the rejecting range.
*/

namespace scfg {

class Range;
using RangePtr = std::shared_ptr<const Range>;

// A recoverable validation failure. Returned, never thrown
struct RangeError {
  RangePtr range;   // null when the value does not fit the schema structure at all
  Path path;
  YAML::Node value;

  std::string range_description() const;
  std::string Describe() const;
};

// Completed value or RangeError
class Completion {
public:
  static Completion Success(YAML::Node value);
  static Completion Failure(RangeError error);

  bool ok() const { return ok_; }

  // Throws std::logic_error when called on the wrong alternative
  const YAML::Node& value() const;
  const RangeError& error() const;

private:
  Completion(bool ok, std::optional<YAML::Node> value, std::optional<RangeError> error);

  bool ok_;
  std::optional<YAML::Node> value_;
  std::optional<RangeError> error_;
};

// Called once per scalar leaf with the leaf's range, location and completed value
using ScalarVisitor = std::function<void(const Range&, const Path&, const YAML::Node&)>;

class Range : public std::enable_shared_from_this<Range> {
public:
  explicit Range(std::string description);
  virtual ~Range() = default;

  Range(const Range&) = delete;
  Range& operator=(const Range&) = delete;

  const std::string& description() const { return description_; }

  virtual Completion complete(const Path& path, const YAML::Node& raw) const = 0;

  // Completes 'value' (fatal if it does not complete) and folds the result
  void fold(const Path& path, const ScalarVisitor& visit, const YAML::Node& value) const;

  // Visits the leaves of a value this range already completed
  virtual void fold_completed(const Path& path, const ScalarVisitor& visit,
                              const YAML::Node& completed) const = 0;

protected:
  // RangeError blaming this range
  Completion Reject(const Path& path, const YAML::Node& value) const;

private:
  std::string description_;
};

// Threads an accumulator through range.fold: acc = f(range, path, acc, scalar)
template <typename Acc, typename Fn>
Acc FoldRange(const Range& range, const Path& path, Fn f, Acc init, const YAML::Node& value) {
  Acc acc = std::move(init);
  range.fold(path,
             [&acc, &f](const Range& leaf, const Path& leaf_path, const YAML::Node& scalar) {
               acc = f(leaf, leaf_path, std::move(acc), scalar);
             },
             value);
  return acc;
}

// Same over a value 'range' already completed
template <typename Acc, typename Fn>
Acc FoldCompletedRange(const Range& range, const Path& path, Fn f, Acc init, const YAML::Node& completed) {
  Acc acc = std::move(init);
  range.fold_completed(path,
                       [&acc, &f](const Range& leaf, const Path& leaf_path, const YAML::Node& scalar) {
                         acc = f(leaf, leaf_path, std::move(acc), scalar);
                       },
                       completed);
  return acc;
}

// Building block for leaf ranges. The completer returns nullopt to reject
using ScalarCompleter = std::function<std::optional<YAML::Node>(const Path&, const YAML::Node&)>;
RangePtr MakeScalarRange(std::string description, ScalarCompleter completer);

// nil -> default, everything else passes through
RangePtr AnyRange(YAML::Node default_value = YAML::Node());

// Rejects nil, everything else passes through
RangePtr NonNilRange();

// nil -> default, pred(v) -> v, otherwise rejected
RangePtr PredicateRange(std::string description, std::function<bool(const YAML::Node&)> pred,
                        YAML::Node default_value);

// Accepted booleans and integers are stored decoded: 'yes' becomes true, '0x10' becomes 16
RangePtr BooleanRange(bool default_value);
RangePtr DefaultBooleanRange();  // defaults to false

RangePtr StringRange(std::string default_value);
RangePtr DefaultStringRange();   // defaults to ""
RangePtr NonEmptyStringRange(std::string default_value);

RangePtr IntegerRange(std::int64_t default_value);
RangePtr IntegerBetweenRange(std::int64_t min, std::int64_t max, std::int64_t default_value);
RangePtr NumberRange(double default_value);

} // namespace scfg
