#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/checkbox_mark.hpp"
#include "internal/model/parameter_line.hpp"

namespace relaynorm::runtime::config {
class CorrelationConfig;
class CalibrationSample;
} // namespace relaynorm::runtime::config

namespace relaynorm::detect {

struct CorrelationSettings {
  double coordinate_scale        = 1.0; // text units per pixel
  double tolerance               = 5.0;
  double ambiguity_epsilon       = 0.5;
  double max_horizontal_distance = 0.0; // 0 disables the check
  bool   include_ambiguous       = false;

  static CorrelationSettings FromConfig(const relaynorm::runtime::config::CorrelationConfig& config);
};

struct CheckboxMatch {
  std::size_t line_index     = 0;
  std::size_t checkbox_index = 0;
  double      distance       = 0.0;

  // another line sits within epsilon of the same distance
  bool ambiguous = false;
};

struct CorrelationResult {
  std::vector<CheckboxMatch> matches; // in line order
  std::vector<std::size_t>   unmatched_checkboxes;
};

/*
  CheckboxCorrelator

  Pairs checkboxes with parameter lines by vertical distance after
  scaling checkbox centres into text space.

  Every (line, checkbox) pair within tolerance is ranked by distance,
  then line reading order, then checkbox index, and taken greedily;
  a line and a checkbox are each used at most once. So for any match
  (p, c) no unmatched checkbox is strictly closer to p than c.
*/
class CheckboxCorrelator {
 public:
  explicit CheckboxCorrelator(CorrelationSettings settings);

  CorrelationResult Correlate(const std::vector<model::CheckboxMark>& checkboxes, const std::vector<model::ParameterLine>& lines) const;

  // vertical distance in text units
  double Distance(const model::CheckboxMark& checkbox, const model::ParameterLine& line) const;

  // share of sample checkboxes that land on their expected code
  double CalibrationAccuracy(const relaynorm::runtime::config::CalibrationSample& sample) const;

  const CorrelationSettings& Settings() const {
    return settings_;
  }

 private:
  bool WithinReach(const model::CheckboxMark& checkbox, const model::ParameterLine& line) const;

  CorrelationSettings settings_;
};

} // namespace relaynorm::detect
