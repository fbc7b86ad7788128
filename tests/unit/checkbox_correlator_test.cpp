#include "internal/detect/checkbox_correlator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/strategy/checkbox_strategy.hpp"

namespace {

using relaynorm::detect::CheckboxCorrelator;
using relaynorm::detect::CorrelationSettings;
using relaynorm::model::CheckboxMark;
using relaynorm::model::ParameterLine;

ParameterLine Line(const std::string& code, double y, double x = 40.0) {
  ParameterLine line;
  line.code        = code;
  line.description = "setting " + code;
  line.x           = x;
  line.y           = y;
  return line;
}

CheckboxMark Box(double center_y, bool marked = false, double center_x = 100.0) {
  CheckboxMark mark;
  mark.center_x = center_x;
  mark.center_y = center_y;
  mark.marked   = marked;
  return mark;
}

CorrelationSettings Settings() {
  CorrelationSettings settings;
  settings.coordinate_scale  = 0.5;
  settings.tolerance         = 5.0;
  settings.ambiguity_epsilon = 0.5;
  return settings;
}

void TestNearestPairsAreMatched() {
  CheckboxCorrelator correlator(Settings());

  const std::vector<ParameterLine> lines = {Line("0160", 100.0), Line("0161", 112.0), Line("0170", 124.0)};
  // centres in pixels; 0.5 text units per pixel
  const std::vector<CheckboxMark> boxes = {Box(249.0), Box(200.0), Box(225.0)};

  const auto result = correlator.Correlate(boxes, lines);
  assert(result.matches.size() == 3);
  assert(result.unmatched_checkboxes.empty());

  assert(result.matches[0].line_index == 0 && result.matches[0].checkbox_index == 1);
  assert(result.matches[1].line_index == 1 && result.matches[1].checkbox_index == 2);
  assert(result.matches[2].line_index == 2 && result.matches[2].checkbox_index == 0);
  assert(result.matches[1].distance == 0.5);
  for (const auto& match : result.matches) assert(!match.ambiguous);
}

void TestMatchesRespectToleranceAndAreLocallyClosest() {
  CheckboxCorrelator correlator(Settings());

  const std::vector<ParameterLine> lines = {Line("0101", 100.0), Line("0102", 106.0), Line("0103", 160.0)};
  const std::vector<CheckboxMark>  boxes = {Box(204.0), Box(210.0), Box(260.0), Box(400.0)};

  const auto result = correlator.Correlate(boxes, lines);

  std::vector<bool> used(boxes.size(), false);
  for (const auto& match : result.matches) used[match.checkbox_index] = true;

  for (const auto& match : result.matches) {
    const auto& line = lines[match.line_index];
    assert(match.distance <= Settings().tolerance);
    assert(match.distance == correlator.Distance(boxes[match.checkbox_index], line));
    for (std::size_t c = 0; c < boxes.size(); ++c) {
      if (used[c]) continue;
      assert(correlator.Distance(boxes[c], line) >= match.distance);
    }
  }

  // 0103 at y=160 has no checkbox within 5 units; y=200 and y=130 are unmatched
  assert(result.matches.size() == 2);
  assert(result.unmatched_checkboxes.size() == 2);
  assert(result.unmatched_checkboxes[0] == 2);
  assert(result.unmatched_checkboxes[1] == 3);
}

void TestEquidistantLinesAreAmbiguous() {
  CheckboxCorrelator correlator(Settings());

  const std::vector<ParameterLine> lines = {Line("0201", 100.0), Line("0202", 104.0)};
  const std::vector<CheckboxMark>  boxes = {Box(204.0, true)};

  const auto result = correlator.Correlate(boxes, lines);
  assert(result.matches.size() == 1);
  assert(result.matches[0].ambiguous);
  // reading order breaks the tie
  assert(result.matches[0].line_index == 0);
}

void TestHorizontalReach() {
  auto settings                    = Settings();
  settings.max_horizontal_distance = 50.0;
  CheckboxCorrelator correlator(settings);

  const std::vector<ParameterLine> lines = {Line("0301", 100.0, 40.0)};
  const std::vector<CheckboxMark>  far   = {Box(200.0, false, 400.0)};
  const std::vector<CheckboxMark>  near  = {Box(200.0, false, 120.0)};

  assert(correlator.Correlate(far, lines).matches.empty());
  assert(correlator.Correlate(near, lines).matches.size() == 1);
}

void TestCalibrationAccuracy() {
  relaynorm::runtime::config::CalibrationSample sample;
  sample.set_name("page2");
  auto add_line = [&](const std::string& code, double y) {
    auto* line = sample.add_lines();
    line->set_code(code);
    line->set_x(40.0);
    line->set_y(y);
  };
  auto add_box = [&](double y, const std::string& expected) {
    auto* box = sample.add_checkboxes();
    box->set_center_x(100.0);
    box->set_center_y(y);
    box->set_expected_code(expected);
  };
  add_line("0160", 100.0);
  add_line("0161", 112.0);
  add_box(200.0, "0160");
  add_box(224.0, "0161");
  add_box(300.0, "");

  CheckboxCorrelator correlator(Settings());
  assert(correlator.CalibrationAccuracy(sample) == 1.0);

  sample.mutable_checkboxes(1)->set_expected_code("0160");
  const double accuracy = correlator.CalibrationAccuracy(sample);
  assert(std::fabs(accuracy - 2.0 / 3.0) < 1e-9);

  relaynorm::runtime::config::CalibrationSample empty;
  assert(correlator.CalibrationAccuracy(empty) == 1.0);
}

void TestStrategyTurnsMatchesIntoFlagsAndNotes() {
  relaynorm::runtime::config::RelayModelProfile profile;
  profile.set_name("p3");
  profile.set_strategy(relaynorm::runtime::config::DETECTION_STRATEGY_CHECKBOX);
  profile.mutable_correlation()->set_coordinate_scale(0.5);
  profile.mutable_correlation()->set_tolerance(5.0);
  profile.mutable_correlation()->set_ambiguity_epsilon(0.5);

  relaynorm::strategy::CheckboxStrategy strategy(profile);

  relaynorm::strategy::PageContent page;
  page.layer.set_index(3);
  page.lines = {Line("0160", 100.0), Line("0161", 112.0), Line("0170", 116.0)};

  // 0160 marked; the second box sits halfway between 0161 and 0170
  const std::vector<CheckboxMark> marks = {Box(200.0, true), Box(228.0, true), Box(400.0, true)};

  std::vector<relaynorm::strategy::ReviewNote> notes;
  const auto                                   flags = strategy.Correlate(page, marks, notes);

  assert(flags.size() == 1);
  assert(flags[0].function_code == "0160");
  assert(flags[0].active);
  assert(flags[0].method == relaynorm::model::DetectionMethod::kCheckbox);

  assert(notes.size() == 2);
  assert(notes[0].kind == relaynorm::v1::REVIEW_KIND_DETECTION_AMBIGUOUS);
  assert(notes[0].parameter_code == "0161");
  assert(notes[0].page_index == 3);
  assert(notes[1].kind == relaynorm::v1::REVIEW_KIND_UNMATCHED_CHECKBOX);

  profile.mutable_correlation()->set_include_ambiguous(true);
  relaynorm::strategy::CheckboxStrategy inclusive(profile);
  notes.clear();
  const auto all = inclusive.Correlate(page, marks, notes);
  assert(all.size() == 2);
  assert(all[1].ambiguous);
}

} // namespace

int main() {
  TestNearestPairsAreMatched();
  TestMatchesRespectToleranceAndAreLocallyClosest();
  TestEquidistantLinesAreAmbiguous();
  TestHorizontalReach();
  TestCalibrationAccuracy();
  TestStrategyTurnsMatchesIntoFlagsAndNotes();

  std::cout << "relaynorm_unit_checkbox_correlator: pass\n";
  return 0;
}
