#include "internal/strategy/labeled_field_strategy.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/defaults.hpp"

namespace {

using relaynorm::model::DetectionMethod;
using relaynorm::runtime::config::RelayModelProfile;
using relaynorm::strategy::DocumentContent;
using relaynorm::strategy::LabeledFieldStrategy;
using relaynorm::strategy::ReviewNote;

RelayModelProfile MicomProfile(bool unknown_is_active) {
  RelayModelProfile profile;
  profile.set_name("micom_p14x");
  profile.set_strategy(relaynorm::runtime::config::DETECTION_STRATEGY_LABELED_FIELD);
  for (const auto& marker : relaynorm::config::DefaultDisabledMarkers()) profile.mutable_labeled_field()->add_disabled_markers(marker);
  for (const auto& marker : relaynorm::config::DefaultEnabledMarkers()) profile.mutable_labeled_field()->add_enabled_markers(marker);
  profile.mutable_labeled_field()->set_unknown_marker_is_active(unknown_is_active);

  auto add = [&](const std::string& code, std::vector<std::string> labels) {
    auto* function = profile.add_functions();
    function->set_code(code);
    for (const auto& label : labels) function->add_labels(label);
  };
  add("50/51-1", {"I>1 Function"});
  add("50/51-2", {"I>2 Function"});
  add("50N/51N-1", {"IN1>1 Function", "IN>1 Function"});
  add("46", {"I2>1 Function"});
  add("27", {"V<1 Function"});
  return profile;
}

DocumentContent Text(const std::string& text) {
  DocumentContent content;
  content.document.file_name = "P143_12-SL-04.txt";
  content.text               = text;
  return content;
}

void TestMarkersOnSameAndNextLine() {
  LabeledFieldStrategy strategy(MicomProfile(true));

  const auto content = Text(
      "MiCOM P143 settings\n"
      "I>1 Function: IEC S Inverse\n"
      "I>2 Function:\n"
      "\n"
      "Disabled\n"
      "IN>1 Function    DT\n"
      "I2>1 Function\n"
      "V<1 Function: Enabled\n");

  std::vector<ReviewNote> notes;
  const auto              flags = strategy.Detect(content, notes);
  assert(notes.empty());
  assert(flags.size() == 5);

  assert(flags[0].function_code == "50/51-1");
  assert(flags[0].active);
  assert(flags[0].group_index == std::optional<int>(0));
  assert(flags[0].method == DetectionMethod::kLabeledField);
  assert(flags[0].description == "I>1 Function");

  // marker on the next non-empty line
  assert(flags[1].function_code == "50/51-2");
  assert(!flags[1].active);

  // second label variant proves the function active
  assert(flags[2].function_code == "50N/51N-1");
  assert(flags[2].active);
  assert(flags[2].group_index == std::optional<int>(1));

  // followed directly by another label: no marker
  assert(flags[3].function_code == "46");
  assert(!flags[3].active);

  assert(flags[4].active);
}

void TestUnknownMarkersFollowProfile() {
  LabeledFieldStrategy permissive(MicomProfile(true));
  LabeledFieldStrategy strict(MicomProfile(false));

  assert(permissive.MarkerIsActive("IEC S Inverse"));
  assert(!strict.MarkerIsActive("IEC S Inverse"));

  assert(!permissive.MarkerIsActive("DISABLED"));
  assert(!permissive.MarkerIsActive("  "));
  assert(strict.MarkerIsActive("enabled"));
}

void TestMissingLabelsAreInactive() {
  LabeledFieldStrategy strategy(MicomProfile(true));

  std::vector<ReviewNote> notes;
  const auto              flags = strategy.Detect(Text("Nothing of interest\n"), notes);
  assert(flags.size() == 5);
  for (const auto& flag : flags) {
    assert(!flag.active);
    assert(!flag.group_index.has_value());
  }
}

void TestLabelsIgnoreCase() {
  LabeledFieldStrategy strategy(MicomProfile(true));

  std::vector<ReviewNote> notes;
  const auto              flags = strategy.Detect(Text("i>1 function: 1\n"), notes);
  assert(flags[0].active);
}

} // namespace

int main() {
  TestMarkersOnSameAndNextLine();
  TestUnknownMarkersFollowProfile();
  TestMissingLabelsAreInactive();
  TestLabelsIgnoreCase();

  std::cout << "relaynorm_unit_labeled_field_strategy: pass\n";
  return 0;
}
