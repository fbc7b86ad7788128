#include "internal/config/profile_registry.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "internal/config/defaults.hpp"
#include "internal/util/errors.hpp"

namespace {

using relaynorm::config::CalibrationState;
using relaynorm::config::ProfileRegistry;
using relaynorm::runtime::config::RelayModelProfile;
using relaynorm::runtime::config::RuntimeConfig;

RelayModelProfile* AddCheckboxProfile(RuntimeConfig& config, const std::string& name) {
  auto* profile = config.add_profiles();
  profile->set_name(name);
  profile->set_strategy(relaynorm::runtime::config::DETECTION_STRATEGY_CHECKBOX);
  profile->add_extensions(".pdf");
  profile->mutable_correlation()->set_coordinate_scale(0.5);
  profile->mutable_correlation()->set_tolerance(5.0);
  return profile;
}

void AddSample(RelayModelProfile& profile, bool consistent) {
  auto* sample = profile.mutable_correlation()->add_calibration_samples();
  sample->set_name("page2");
  auto* line = sample->add_lines();
  line->set_code("0160");
  line->set_x(40.0);
  line->set_y(100.0);
  auto* box = sample->add_checkboxes();
  box->set_center_x(100.0);
  box->set_center_y(200.0);
  box->set_expected_code(consistent ? "0160" : "0161");
}

RuntimeConfig ValidConfig() {
  RuntimeConfig config;
  AddSample(*AddCheckboxProfile(config, "easergy_p3"), true);

  auto* micom = config.add_profiles();
  micom->set_name("micom_p14x");
  micom->set_strategy(relaynorm::runtime::config::DETECTION_STRATEGY_LABELED_FIELD);
  micom->add_extensions(".txt");
  micom->add_known_units("xIn");
  micom->set_equipment_hint_pattern("Feeder:\\s*(\\S+)");
  auto* fn = micom->add_functions();
  fn->set_code("46");
  fn->add_labels("I2>1 Function");

  auto* sepam = config.add_profiles();
  sepam->set_name("sepam_s40");
  sepam->set_strategy(relaynorm::runtime::config::DETECTION_STRATEGY_KEYED_SECTION);
  sepam->add_extensions(".s40");

  relaynorm::config::ApplyDefaults(config);
  return config;
}

bool RejectsWith(const std::function<void(RuntimeConfig&)>& mutate) {
  auto config = ValidConfig();
  mutate(config);
  try {
    ProfileRegistry registry(config);
  } catch (const relaynorm::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestBuildsEntries() {
  const auto      config = ValidConfig();
  ProfileRegistry registry(config);

  assert(registry.Profiles().size() == 3);
  assert(registry.Profiles()[0]->name() == "easergy_p3");

  const auto& p3 = registry.Get("easergy_p3");
  assert(p3.calibration == CalibrationState::kPassed);
  assert(p3.calibration_accuracy == 1.0);
  assert(p3.extractor != nullptr);

  const auto& micom = registry.Get("micom_p14x");
  assert(micom.calibration == CalibrationState::kNotApplicable);
  assert(micom.normalizer->Normalize("1.2xIn").unit == std::optional<std::string>("xIn"));

  assert(registry.EquipmentHint(micom, "Relay settings\nFeeder: F12-TR2\n") == std::optional<std::string>("F12-TR2"));
  assert(!registry.EquipmentHint(micom, "nothing").has_value());
  assert(!registry.EquipmentHint(registry.Get("sepam_s40"), "Feeder: X").has_value());

  bool threw = false;
  try {
    (void)registry.Get("nope");
  } catch (const relaynorm::util::UnknownModel&) {
    threw = true;
  }
  assert(threw);
}

void TestCalibrationStates() {
  RuntimeConfig config;
  AddCheckboxProfile(config, "uncalibrated");
  AddSample(*AddCheckboxProfile(config, "failing"), false);
  relaynorm::config::ApplyDefaults(config);

  ProfileRegistry registry(config);
  assert(registry.Get("uncalibrated").calibration == CalibrationState::kUncalibrated);

  const auto& failing = registry.Get("failing");
  assert(failing.calibration == CalibrationState::kFailed);
  assert(failing.calibration_accuracy == 0.0);
  assert(failing.calibration_detail.find("page2") != std::string::npos);

  // a lower bar lets the same sample through
  config.mutable_profiles(1)->mutable_correlation()->set_min_calibration_accuracy(0.0);
  ProfileRegistry lenient(config);
  assert(lenient.Get("failing").calibration == CalibrationState::kPassed);

  assert(std::string(relaynorm::config::ToString(CalibrationState::kFailed)) == "failed");
}

void TestValidation() {
  assert(RejectsWith([](RuntimeConfig& c) { c.clear_profiles(); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(0)->clear_name(); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(1)->set_name("easergy_p3"); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(0)->set_strategy(relaynorm::runtime::config::DETECTION_STRATEGY_UNSPECIFIED); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(2)->clear_extensions(); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(2)->set_extensions(0, "s40"); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(0)->add_filename_patterns("[p3"); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(0)->mutable_correlation()->set_coordinate_scale(0.0); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(0)->mutable_checkbox()->set_density_threshold(1.5); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(0)->mutable_checkbox()->set_min_size_px(60); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(1)->mutable_functions(0)->clear_labels(); }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(1)->clear_functions(); }));
  assert(RejectsWith([](RuntimeConfig& c) {
    auto* fn = c.mutable_profiles(1)->add_functions();
    fn->set_code("46");
    fn->add_labels("I2>2 Function");
  }));
  assert(RejectsWith([](RuntimeConfig& c) { c.mutable_profiles(2)->mutable_keyed_section()->clear_activation_key_prefix(); }));
}

} // namespace

int main() {
  TestBuildsEntries();
  TestCalibrationStates();
  TestValidation();

  std::cout << "relaynorm_unit_profile_registry: pass\n";
  return 0;
}
