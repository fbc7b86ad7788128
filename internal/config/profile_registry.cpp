#include "profile_registry.hpp"

#include <algorithm>
#include <sstream>

#include "internal/detect/checkbox_correlator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relaynorm::config {

namespace {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;
using relaynorm::runtime::config::RelayModelProfile;
using relaynorm::runtime::config::RuntimeConfig;

void Fail(const RelayModelProfile& profile, const std::string& message) {
  throw util::InvalidConfig("profile '" + profile.name() + "': " + message);
}

void CheckRegex(const RelayModelProfile& profile, const std::string& pattern, const char* what) {
  try {
    static_cast<void>(std::regex(pattern));
  } catch (const std::regex_error& e) {
    Fail(profile, std::string("invalid ") + what + " '" + pattern + "': " + e.what());
  }
}

} // namespace

const char* ToString(CalibrationState state) {
  switch (state) {
    case CalibrationState::kNotApplicable:
      return "not_applicable";
    case CalibrationState::kPassed:
      return "passed";
    case CalibrationState::kUncalibrated:
      return "uncalibrated";
    case CalibrationState::kFailed:
      return "failed";
  }
  return "unknown";
}

ProfileRegistry::ProfileRegistry(const RuntimeConfig& config)
    : base_normalizer_(normalize::UnitVocabulary::FromConfig(config.normalizer())) {
  if (config.profiles().empty()) {
    throw util::InvalidConfig("no relay model profiles configured");
  }

  for (const auto& profile : config.profiles()) {
    Validate(profile);
    if (entries_.count(profile.name()) != 0) {
      throw util::InvalidConfig("duplicate profile name '" + profile.name() + "'");
    }

    ProfileEntry entry;
    entry.profile = &profile;

    std::vector<std::string> units(profile.known_units().begin(), profile.known_units().end());
    entry.normalizer = std::make_unique<normalize::UnitNormalizer>(base_normalizer_.WithAdditionalUnits(units));
    entry.extractor  = std::make_unique<extract::ParameterLineExtractor>(profile.extractor());
    if (!profile.equipment_hint_pattern().empty()) {
      entry.equipment_hint.emplace(profile.equipment_hint_pattern(), std::regex::ECMAScript | std::regex::icase);
    }

    Calibrate(entry);

    RELAYNORM_LOG_INFO("Registered relay model profile",
                       {StringField("profile", profile.name()),
                        StringField("strategy", relaynorm::runtime::config::DetectionStrategy_Name(profile.strategy())),
                        IntField("functions", profile.functions_size()), StringField("calibration", ToString(entry.calibration))});

    profiles_.push_back(&profile);
    entries_.emplace(profile.name(), std::move(entry));
  }
}

const ProfileEntry& ProfileRegistry::Get(const std::string& name) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    throw util::UnknownModel("unknown profile '" + name + "'");
  }
  return it->second;
}

std::optional<std::string> ProfileRegistry::EquipmentHint(const ProfileEntry& entry, const std::string& text) const {
  if (!entry.equipment_hint) return std::nullopt;

  std::smatch match;
  if (!std::regex_search(text, match, *entry.equipment_hint)) return std::nullopt;

  std::string hint = match.size() > 1 && match[1].matched ? match[1].str() : match[0].str();
  if (hint.empty()) return std::nullopt;
  return hint;
}

void ProfileRegistry::Validate(const RelayModelProfile& profile) const {
  if (profile.name().empty()) {
    throw util::InvalidConfig("relay model profile without a name");
  }
  if (profile.strategy() == relaynorm::runtime::config::DETECTION_STRATEGY_UNSPECIFIED) {
    Fail(profile, "strategy must be set");
  }
  if (profile.extensions().empty() && profile.content_signatures().empty()) {
    Fail(profile, "needs at least one extension or content signature");
  }

  for (const auto& s : profile.content_signatures()) CheckRegex(profile, s, "content signature");
  for (const auto& f : profile.filename_patterns()) CheckRegex(profile, f, "filename pattern");
  for (const auto& c : profile.extractor().code_patterns()) CheckRegex(profile, c, "code pattern");
  if (!profile.equipment_hint_pattern().empty()) CheckRegex(profile, profile.equipment_hint_pattern(), "equipment hint pattern");

  for (const auto& ext : profile.extensions()) {
    if (ext.empty() || ext.front() != '.') Fail(profile, "extension '" + ext + "' must start with '.'");
  }

  switch (profile.strategy()) {
    case relaynorm::runtime::config::DETECTION_STRATEGY_CHECKBOX: {
      const auto& cb   = profile.checkbox();
      const auto& corr = profile.correlation();
      if (corr.coordinate_scale() <= 0.0) Fail(profile, "correlation.coordinate_scale must be > 0");
      if (corr.tolerance() <= 0.0) Fail(profile, "correlation.tolerance must be > 0");
      if (corr.ambiguity_epsilon() < 0.0) Fail(profile, "correlation.ambiguity_epsilon must be >= 0");
      if (cb.density_threshold() <= 0.0 || cb.density_threshold() >= 1.0) Fail(profile, "checkbox.density_threshold must be in (0, 1)");
      if (cb.min_size_px() == 0 || cb.min_size_px() > cb.max_size_px()) Fail(profile, "checkbox size range is empty");
      if (cb.interior_inset_px() * 2 >= cb.min_size_px()) Fail(profile, "checkbox.interior_inset_px leaves no interior");
      if (cb.auto_threshold() && cb.auto_threshold_floor() > cb.auto_threshold_ceiling()) {
        Fail(profile, "checkbox.auto_threshold_floor exceeds auto_threshold_ceiling");
      }
      if (corr.min_calibration_accuracy() < 0.0 || corr.min_calibration_accuracy() > 1.0) {
        Fail(profile, "correlation.min_calibration_accuracy must be in [0, 1]");
      }
      break;
    }
    case relaynorm::runtime::config::DETECTION_STRATEGY_LABELED_FIELD:
      if (profile.functions().empty()) Fail(profile, "labeled_field strategy needs function definitions");
      for (const auto& fn : profile.functions()) {
        if (fn.code().empty()) Fail(profile, "function without code");
        if (fn.labels().empty()) Fail(profile, "function '" + fn.code() + "' has no labels");
      }
      break;
    case relaynorm::runtime::config::DETECTION_STRATEGY_KEYED_SECTION:
      if (profile.keyed_section().activation_key_prefix().empty()) Fail(profile, "keyed_section.activation_key_prefix is empty");
      for (const auto& fn : profile.functions()) {
        if (fn.code().empty()) Fail(profile, "function without code");
      }
      break;
    default:
      Fail(profile, "unsupported strategy");
  }

  std::vector<std::string> codes;
  for (const auto& fn : profile.functions()) codes.push_back(fn.code());
  std::sort(codes.begin(), codes.end());
  auto dup = std::adjacent_find(codes.begin(), codes.end());
  if (dup != codes.end()) Fail(profile, "function '" + *dup + "' defined twice");
}

void ProfileRegistry::Calibrate(ProfileEntry& entry) const {
  const auto& profile = *entry.profile;
  if (profile.strategy() != relaynorm::runtime::config::DETECTION_STRATEGY_CHECKBOX) {
    entry.calibration = CalibrationState::kNotApplicable;
    return;
  }

  const auto& corr = profile.correlation();
  if (corr.calibration_samples().empty()) {
    entry.calibration        = CalibrationState::kUncalibrated;
    entry.calibration_detail = "profile has no calibration samples";
    RELAYNORM_LOG_WARN("Checkbox profile is uncalibrated", {StringField("profile", profile.name())});
    return;
  }

  detect::CheckboxCorrelator correlator(detect::CorrelationSettings::FromConfig(corr));

  double      worst = 1.0;
  std::string worst_sample;
  for (const auto& sample : corr.calibration_samples()) {
    const double accuracy = correlator.CalibrationAccuracy(sample);
    RELAYNORM_LOG_DEBUG("Calibration sample",
                        {StringField("profile", profile.name()), StringField("sample", sample.name()), DoubleField("accuracy", accuracy)});
    if (worst_sample.empty() || accuracy < worst) {
      worst        = accuracy;
      worst_sample = sample.name();
    }
  }
  entry.calibration_accuracy = worst;

  if (worst + 1e-9 < corr.min_calibration_accuracy()) {
    std::ostringstream detail;
    detail << "calibration sample '" << worst_sample << "' accuracy " << worst << " below minimum " << corr.min_calibration_accuracy();
    entry.calibration        = CalibrationState::kFailed;
    entry.calibration_detail = detail.str();
    RELAYNORM_LOG_ERROR("Checkbox profile failed calibration",
                        {StringField("profile", profile.name()), StringField("sample", worst_sample), DoubleField("accuracy", worst),
                         DoubleField("minimum", corr.min_calibration_accuracy())});
    return;
  }

  entry.calibration = CalibrationState::kPassed;
}

} // namespace relaynorm::config
