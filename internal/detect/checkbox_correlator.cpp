#include "checkbox_correlator.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

#include "config/config.pb.h"

namespace relaynorm::detect {

using model::CheckboxMark;
using model::ParameterLine;

CorrelationSettings CorrelationSettings::FromConfig(const relaynorm::runtime::config::CorrelationConfig& config) {
  CorrelationSettings settings;
  settings.coordinate_scale        = config.coordinate_scale();
  settings.tolerance               = config.tolerance();
  settings.ambiguity_epsilon       = config.ambiguity_epsilon();
  settings.max_horizontal_distance = config.max_horizontal_distance();
  settings.include_ambiguous       = config.include_ambiguous();
  return settings;
}

CheckboxCorrelator::CheckboxCorrelator(CorrelationSettings settings) : settings_(settings) {
}

double CheckboxCorrelator::Distance(const CheckboxMark& checkbox, const ParameterLine& line) const {
  return std::fabs(checkbox.center_y * settings_.coordinate_scale - line.y);
}

bool CheckboxCorrelator::WithinReach(const CheckboxMark& checkbox, const ParameterLine& line) const {
  if (Distance(checkbox, line) > settings_.tolerance) return false;
  if (settings_.max_horizontal_distance > 0.0) {
    return std::fabs(checkbox.center_x * settings_.coordinate_scale - line.x) <= settings_.max_horizontal_distance;
  }
  return true;
}

CorrelationResult CheckboxCorrelator::Correlate(const std::vector<CheckboxMark>& checkboxes, const std::vector<ParameterLine>& lines) const {
  struct Candidate {
    double      distance;
    std::size_t line;
    std::size_t checkbox;
  };

  std::vector<Candidate> candidates;
  for (std::size_t c = 0; c < checkboxes.size(); ++c) {
    for (std::size_t l = 0; l < lines.size(); ++l) {
      if (!WithinReach(checkboxes[c], lines[l])) continue;
      candidates.push_back({Distance(checkboxes[c], lines[l]), l, c});
    }
  }

  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    return std::tie(a.distance, a.line, a.checkbox) < std::tie(b.distance, b.line, b.checkbox);
  });

  std::vector<bool> line_taken(lines.size(), false);
  std::vector<bool> checkbox_taken(checkboxes.size(), false);

  CorrelationResult result;
  for (const auto& candidate : candidates) {
    if (line_taken[candidate.line] || checkbox_taken[candidate.checkbox]) continue;
    line_taken[candidate.line]         = true;
    checkbox_taken[candidate.checkbox] = true;

    CheckboxMatch match;
    match.line_index     = candidate.line;
    match.checkbox_index = candidate.checkbox;
    match.distance       = candidate.distance;

    const auto& checkbox = checkboxes[candidate.checkbox];
    for (std::size_t l = 0; l < lines.size(); ++l) {
      if (l == candidate.line || !WithinReach(checkbox, lines[l])) continue;
      if (std::fabs(Distance(checkbox, lines[l]) - candidate.distance) <= settings_.ambiguity_epsilon) {
        match.ambiguous = true;
        break;
      }
    }
    result.matches.push_back(match);
  }

  std::sort(result.matches.begin(), result.matches.end(), [](const CheckboxMatch& a, const CheckboxMatch& b) { return a.line_index < b.line_index; });

  for (std::size_t c = 0; c < checkboxes.size(); ++c) {
    if (!checkbox_taken[c]) result.unmatched_checkboxes.push_back(c);
  }
  return result;
}

double CheckboxCorrelator::CalibrationAccuracy(const relaynorm::runtime::config::CalibrationSample& sample) const {
  if (sample.checkboxes().empty()) return 1.0;

  std::vector<ParameterLine> lines;
  for (const auto& line : sample.lines()) {
    ParameterLine parameter;
    parameter.code = line.code();
    parameter.x    = line.x();
    parameter.y    = line.y();
    lines.push_back(std::move(parameter));
  }

  std::vector<CheckboxMark> checkboxes;
  for (const auto& checkbox : sample.checkboxes()) {
    CheckboxMark mark;
    mark.center_x = checkbox.center_x();
    mark.center_y = checkbox.center_y();
    checkboxes.push_back(mark);
  }

  const auto result = Correlate(checkboxes, lines);

  std::vector<const std::string*> assigned(checkboxes.size(), nullptr);
  for (const auto& match : result.matches) {
    assigned[match.checkbox_index] = &lines[match.line_index].code;
  }

  int correct = 0;
  for (int c = 0; c < sample.checkboxes_size(); ++c) {
    const auto& expected = sample.checkboxes(c).expected_code();
    const auto* got      = assigned[static_cast<std::size_t>(c)];
    if (expected.empty() ? got == nullptr : (got != nullptr && *got == expected)) ++correct;
  }
  return static_cast<double>(correct) / static_cast<double>(sample.checkboxes_size());
}

} // namespace relaynorm::detect
