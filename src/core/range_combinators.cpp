#include "core/range_combinators.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "core/node_util.hpp"

namespace scfg {

static std::string JoinDescriptions(const std::vector<RangePtr>& ranges, const char* sep) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    if (i > 0) oss << sep;
    oss << ranges[i]->description();
  }
  return oss.str();
}

// Map keys become path elements by their scalar text
static PathElement KeySlot(const YAML::Node& key) {
  if (auto k = KeyString(key)) return *k;
  return NodeToString(key);
}

namespace {

class OptionalRangeImpl : public Range {
public:
  explicit OptionalRangeImpl(RangePtr range)
      : Range("optional " + range->description()), range_(std::move(range)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    if (IsNil(raw)) return Completion::Success(YAML::Node());
    return range_->complete(path, raw);
  }

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    if (IsNil(completed)) return;
    range_->fold_completed(path, visit, completed);
  }

private:
  RangePtr range_;
};

class OptionalDefaultRangeImpl : public Range {
public:
  OptionalDefaultRangeImpl(RangePtr range, YAML::Node default_value)
      : Range(range->description() + " (default " + NodeToString(default_value) + ")"),
        range_(std::move(range)),
        default_(std::move(default_value)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    return range_->complete(path, IsNil(raw) ? YAML::Clone(default_) : raw);
  }

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    range_->fold_completed(path, visit, completed);
  }

private:
  RangePtr range_;
  YAML::Node default_;
};

class OneOfRangeImpl : public Range {
public:
  OneOfRangeImpl(std::vector<YAML::Node> values, YAML::Node default_value, NodeEquality equal)
      : Range(Describe(values)),
        values_(std::move(values)),
        default_(std::move(default_value)),
        equal_(std::move(equal)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    if (IsNil(raw)) return Completion::Success(YAML::Clone(default_));
    for (const auto& candidate : values_) {
      if (equal_(raw, candidate)) return Completion::Success(raw);
    }
    return Reject(path, raw);
  }

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    visit(*this, path, completed);
  }

private:
  static std::string Describe(const std::vector<YAML::Node>& values) {
    std::ostringstream oss;
    oss << "one of [";
    for (std::size_t i = 0; i < values.size(); ++i) {
      if (i > 0) oss << ", ";
      oss << NodeToString(values[i]);
    }
    oss << "]";
    return oss.str();
  }

  std::vector<YAML::Node> values_;
  YAML::Node default_;
  NodeEquality equal_;
};

class AnyOfRangeImpl : public Range {
public:
  explicit AnyOfRangeImpl(std::vector<RangePtr> alternatives)
      : Range("any of (" + JoinDescriptions(alternatives, " | ") + ")"),
        alternatives_(std::move(alternatives)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    for (const auto& alt : alternatives_) {
      Completion c = alt->complete(path, raw);
      if (c.ok()) return c;
    }
    return Reject(path, raw);
  }

  // Folds through the first alternative that accepts the completed value. When none does
  // (a RangeMap alternative changed its shape) the value is one leaf of this range
  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    for (const auto& alt : alternatives_) {
      if (alt->complete(path, completed).ok()) {
        alt->fold_completed(path, visit, completed);
        return;
      }
    }
    visit(*this, path, completed);
  }

private:
  std::vector<RangePtr> alternatives_;
};

// Shared element loop of sequence-of and set-of
class ElementsRange : public Range {
public:
  ElementsRange(std::string description, RangePtr element)
      : Range(std::move(description)), element_(std::move(element)) {}

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    for (std::size_t i = 0; i < completed.size(); ++i) {
      element_->fold_completed(PathAppend(path, i), visit, completed[i]);
    }
  }

protected:
  Completion complete_elements(const Path& path, const YAML::Node& raw) const {
    if (IsNil(raw)) return Completion::Success(EmptySequence());
    if (!raw.IsSequence()) return Reject(path, raw);

    YAML::Node out = EmptySequence();
    for (std::size_t i = 0; i < raw.size(); ++i) {
      Completion c = element_->complete(PathAppend(path, i), raw[i]);
      if (!c.ok()) return c;
      out.push_back(c.value());
    }
    return Completion::Success(out);
  }

private:
  RangePtr element_;
};

class SequenceOfRangeImpl : public ElementsRange {
public:
  explicit SequenceOfRangeImpl(RangePtr element)
      : ElementsRange("sequence of " + element->description(), element) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    return complete_elements(path, raw);
  }
};

class SetOfRangeImpl : public ElementsRange {
public:
  explicit SetOfRangeImpl(RangePtr element)
      : ElementsRange("set of " + element->description(), element) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    Completion c = complete_elements(path, raw);
    if (!c.ok()) return c;

    const YAML::Node& elements = c.value();
    YAML::Node out = EmptySequence();
    std::vector<YAML::Node> seen;
    for (std::size_t i = 0; i < elements.size(); ++i) {
      const YAML::Node e = elements[i];
      const bool dup = std::any_of(seen.begin(), seen.end(),
                                   [&e](const YAML::Node& s) { return NodesEqual(s, e); });
      if (dup) continue;
      seen.push_back(e);
      out.push_back(e);
    }
    return Completion::Success(out);
  }
};

class TupleOfRangeImpl : public Range {
public:
  explicit TupleOfRangeImpl(std::vector<RangePtr> ranges)
      : Range("tuple of (" + JoinDescriptions(ranges, ", ") + ")"), ranges_(std::move(ranges)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    if (IsNil(raw) || !raw.IsSequence()) return Reject(path, raw);

    YAML::Node out = EmptySequence();
    const std::size_t n = std::min(ranges_.size(), raw.size());
    for (std::size_t i = 0; i < n; ++i) {
      Completion c = ranges_[i]->complete(PathAppend(path, i), raw[i]);
      if (!c.ok()) return c;
      out.push_back(c.value());
    }
    return Completion::Success(out);
  }

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    const std::size_t n = std::min(ranges_.size(), completed.size());
    for (std::size_t i = 0; i < n; ++i) {
      ranges_[i]->fold_completed(PathAppend(path, i), visit, completed[i]);
    }
  }

private:
  std::vector<RangePtr> ranges_;
};

class MapOfRangeImpl : public Range {
public:
  MapOfRangeImpl(RangePtr key_range, RangePtr value_range)
      : Range("map of " + key_range->description() + " to " + value_range->description()),
        key_range_(std::move(key_range)),
        value_range_(std::move(value_range)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    if (IsNil(raw)) return Completion::Success(EmptyMap());
    if (!raw.IsMap()) return Reject(path, raw);

    YAML::Node out = EmptyMap();
    for (const auto& kv : raw) {
      const Path slot = PathAppend(path, KeySlot(kv.first));
      Completion k = key_range_->complete(slot, kv.first);
      if (!k.ok()) return k;
      Completion v = value_range_->complete(slot, kv.second);
      if (!v.ok()) return v;
      out.force_insert(k.value(), v.value());
    }
    return Completion::Success(out);
  }

  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    for (const auto& kv : completed) {
      const Path slot = PathAppend(path, KeySlot(kv.first));
      key_range_->fold_completed(slot, visit, kv.first);
      value_range_->fold_completed(slot, visit, kv.second);
    }
  }

private:
  RangePtr key_range_;
  RangePtr value_range_;
};

class RangeMapImpl : public Range {
public:
  RangeMapImpl(std::string description, RangePtr range, std::function<YAML::Node(const YAML::Node&)> f)
      : Range(std::move(description)), range_(std::move(range)), f_(std::move(f)) {}

  Completion complete(const Path& path, const YAML::Node& raw) const override {
    Completion c = range_->complete(path, raw);
    if (!c.ok()) return c;
    return Completion::Success(f_(c.value()));
  }

  // The mapped value is one leaf, whatever shape the inner range has
  void fold_completed(const Path& path, const ScalarVisitor& visit,
                      const YAML::Node& completed) const override {
    visit(*this, path, completed);
  }

private:
  RangePtr range_;
  std::function<YAML::Node(const YAML::Node&)> f_;
};

} // namespace

RangePtr OptionalRange(RangePtr range) {
  return std::make_shared<OptionalRangeImpl>(std::move(range));
}

RangePtr OptionalDefaultRange(RangePtr range, YAML::Node default_value) {
  return std::make_shared<OptionalDefaultRangeImpl>(std::move(range), std::move(default_value));
}

RangePtr OneOfRange(std::vector<YAML::Node> values, YAML::Node default_value) {
  return std::make_shared<OneOfRangeImpl>(std::move(values), std::move(default_value), NodesEqual);
}

RangePtr OneOfRangeCustomCompare(std::vector<YAML::Node> values, YAML::Node default_value,
                                 NodeEquality equal) {
  return std::make_shared<OneOfRangeImpl>(std::move(values), std::move(default_value), std::move(equal));
}

RangePtr AnyOfRange(std::vector<RangePtr> alternatives) {
  return std::make_shared<AnyOfRangeImpl>(std::move(alternatives));
}

RangePtr SequenceOfRange(RangePtr element) {
  return std::make_shared<SequenceOfRangeImpl>(std::move(element));
}

RangePtr SetOfRange(RangePtr element) {
  return std::make_shared<SetOfRangeImpl>(std::move(element));
}

RangePtr TupleOfRange(std::vector<RangePtr> ranges) {
  return std::make_shared<TupleOfRangeImpl>(std::move(ranges));
}

RangePtr MapOfRange(RangePtr key_range, RangePtr value_range) {
  return std::make_shared<MapOfRangeImpl>(std::move(key_range), std::move(value_range));
}

RangePtr RangeMap(std::string description, RangePtr range,
                  std::function<YAML::Node(const YAML::Node&)> f) {
  return std::make_shared<RangeMapImpl>(std::move(description), std::move(range), std::move(f));
}

} // namespace scfg
