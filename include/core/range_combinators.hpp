#pragma once

#include <functional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "core/range.hpp"

/*
  Ranges built from other ranges. Each completes its parts in order and returns the first
  RangeError it meets, unchanged. Partial results are never returned.
*/

namespace scfg {

// nil stays nil (and folds to nothing), anything else goes through 'range'
RangePtr OptionalRange(RangePtr range);

// nil is replaced by 'default_value' before 'range' sees it
RangePtr OptionalDefaultRange(RangePtr range, YAML::Node default_value);

// nil -> default, members of 'values' (structural equality) pass, others are rejected
RangePtr OneOfRange(std::vector<YAML::Node> values, YAML::Node default_value);

using NodeEquality = std::function<bool(const YAML::Node&, const YAML::Node&)>;
RangePtr OneOfRangeCustomCompare(std::vector<YAML::Node> values, YAML::Node default_value,
                                 NodeEquality equal);

// First alternative that completes wins, regardless of later ones
RangePtr AnyOfRange(std::vector<RangePtr> alternatives);

// nil -> [], elements are completed at path + [index]
RangePtr SequenceOfRange(RangePtr element);

// SequenceOfRange with structurally equal elements collapsed, first occurrence kept
RangePtr SetOfRange(RangePtr element);

// Positional: element i goes through ranges[i]. Extra or missing elements are dropped
RangePtr TupleOfRange(std::vector<RangePtr> ranges);

// nil -> {}, keys and values are completed at path + [key]
RangePtr MapOfRange(RangePtr key_range, RangePtr value_range);

// Completes through 'range' then applies 'f' to the result. Errors are passed on as they are
RangePtr RangeMap(std::string description, RangePtr range,
                  std::function<YAML::Node(const YAML::Node&)> f);

} // namespace scfg
