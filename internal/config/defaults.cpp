#include "defaults.hpp"

#include <thread>

namespace relaynorm::config {

using relaynorm::runtime::config::EquipmentPattern;
using relaynorm::runtime::config::MultipartPattern;
using relaynorm::runtime::config::RelayModelProfile;
using relaynorm::runtime::config::RuntimeConfig;

const std::vector<std::string>& DefaultKnownUnits() {
  static const std::vector<std::string> kUnits = {
      "MHz", "kHz", "Hz",  "kA",   "mA",  "A",  "kV",  "mV", "V",  "μs", "ms", "s",  "Ω",  "ohm", "MVA", "kVA", "VA",
      "MW",  "kW",  "W",   "Mvar", "kvar", "var", "°C", "°F", "deg", "°",  "%",  "km", "m",  "cm",  "mm",  "In",  "Vn",
      "pu",  "cyc", "min", "h",
  };
  return kUnits;
}

const std::map<std::string, std::string>& DefaultUnitAliases() {
  static const std::map<std::string, std::string> kAliases = {
      {"ohm", "Ω"},
      {"deg", "°"},
      {"us", "μs"},
      {"µs", "μs"},
      {"ºC", "°C"},
      {"ºF", "°F"},
  };
  return kAliases;
}

const std::vector<std::string>& DefaultTrueMarkers() {
  static const std::vector<std::string> kMarkers = {"on", "yes", "true", "sim", "oui", "enabled"};
  return kMarkers;
}

const std::vector<std::string>& DefaultFalseMarkers() {
  static const std::vector<std::string> kMarkers = {"off", "no", "false", "não", "nao", "non", "disabled"};
  return kMarkers;
}

const std::vector<std::string>& DefaultStatusPatterns() {
  static const std::vector<std::string> kPatterns = {
      "status", "alarm", "flags", "ddb", "bit ?mask", "binary", "opto input", "relay output",
  };
  return kPatterns;
}

const std::vector<std::string>& DefaultEncodings() {
  static const std::vector<std::string> kEncodings = {"utf-8", "cp1252", "latin-1"};
  return kEncodings;
}

const std::vector<std::string>& DefaultBundleSuffixes() {
  static const std::vector<std::string> kSuffixes = {".pages.json"};
  return kSuffixes;
}

const std::vector<std::string>& DefaultCodePatterns() {
  // Easergy hex addresses (010D, 0160A) and MiCOM cell references (35.23)
  static const std::vector<std::string> kPatterns = {
      R"(^[0-9A-F]{4}[A-Z]?:?$)",
      R"(^\d{2}\.\d{2}[A-Z]?:?$)",
  };
  return kPatterns;
}

const std::vector<std::string>& DefaultDisabledMarkers() {
  static const std::vector<std::string> kMarkers = {"disabled", "none", "off", "not used", "-", "no", "0"};
  return kMarkers;
}

const std::vector<std::string>& DefaultEnabledMarkers() {
  static const std::vector<std::string> kMarkers = {"enabled", "on", "yes", "1"};
  return kMarkers;
}

std::vector<MultipartPattern> DefaultMultipartPatterns() {
  std::vector<MultipartPattern> patterns(2);

  // "0150: Tripping Matrix part 2: DDB 32-63"
  patterns[0].set_regex(R"(^(?:\d+:\s*)?(.+?)\s+(?:part|PART|Part)\s+(\d+)(?::\s*(.*))?$)");
  patterns[0].set_base_group(1);
  patterns[0].set_part_group(2);

  // "Opto Label (2/4)"
  patterns[1].set_regex(R"(^(?:\d+:\s*)?(.+?)\s+\((\d+)/(\d+)\)(?:\s*(.*))?$)");
  patterns[1].set_base_group(1);
  patterns[1].set_part_group(2);
  patterns[1].set_total_group(3);
  return patterns;
}

std::vector<EquipmentPattern> DefaultEquipmentPatterns() {
  struct Entry {
    const char* name;
    const char* regex;
  };
  // substation number, device type, bay position
  static const Entry kEntries[] = {
      {"sepam_export", R"(^(\d+)-([A-Z]+)-(\d+[A-Z]*)_)"},
      {"micom_spaced", R"(P\d{3}\s+(\d+)-([A-Z]+)-(\d+[A-Z]*))"},
      {"micom_underscore", R"(P\d{3}_(\d+)-([A-Z]+)-(\d+[A-Z]*))"},
      {"bare_tag", R"((\d+)-([A-Z]+)-(\d+[A-Z]*))"},
  };

  std::vector<EquipmentPattern> patterns;
  for (const auto& entry : kEntries) {
    EquipmentPattern pattern;
    pattern.set_name(entry.name);
    pattern.set_regex(entry.regex);
    pattern.set_tag_format("{1}-{2}-{3}");
    pattern.set_substation_group(1);
    pattern.set_device_type_group(2);
    pattern.set_position_group(3);
    patterns.push_back(std::move(pattern));
  }
  return patterns;
}

namespace {

template <typename Repeated, typename Source>
void FillIfEmpty(Repeated* target, const Source& source) {
  if (!target->empty()) return;
  for (const auto& item : source) {
    *target->Add() = item;
  }
}

void ApplyProfileDefaults(RelayModelProfile& profile) {
  auto* extractor = profile.mutable_extractor();
  FillIfEmpty(extractor->mutable_code_patterns(), DefaultCodePatterns());
  if (extractor->column_gap() <= 0.0) extractor->set_column_gap(150.0);
  if (extractor->line_merge_tolerance() <= 0.0) extractor->set_line_merge_tolerance(3.0);

  if (profile.strategy() == relaynorm::runtime::config::DETECTION_STRATEGY_CHECKBOX) {
    auto* checkbox = profile.mutable_checkbox();
    if (checkbox->density_threshold() <= 0.0) checkbox->set_density_threshold(0.316);
    if (checkbox->min_size_px() == 0) checkbox->set_min_size_px(10);
    if (checkbox->max_size_px() == 0) checkbox->set_max_size_px(40);
    if (checkbox->max_aspect_deviation() <= 0.0) checkbox->set_max_aspect_deviation(0.3);
    if (checkbox->interior_inset_px() == 0) checkbox->set_interior_inset_px(3);
    if (checkbox->binarize_threshold() == 0) checkbox->set_binarize_threshold(128);
    if (checkbox->min_border_coverage() <= 0.0) checkbox->set_min_border_coverage(0.8);
    if (checkbox->max_saturation() <= 0.0) checkbox->set_max_saturation(40.0);
    if (checkbox->text_mask_margin_px() == 0) checkbox->set_text_mask_margin_px(1);
    if (checkbox->auto_min_iqr() <= 0.0) checkbox->set_auto_min_iqr(0.2);
    if (checkbox->auto_iqr_fraction() <= 0.0) checkbox->set_auto_iqr_fraction(0.2);
    if (checkbox->auto_threshold_floor() <= 0.0) checkbox->set_auto_threshold_floor(0.25);
    if (checkbox->auto_threshold_ceiling() <= 0.0) checkbox->set_auto_threshold_ceiling(0.40);

    auto* correlation = profile.mutable_correlation();
    if (correlation->ambiguity_epsilon() <= 0.0) correlation->set_ambiguity_epsilon(0.5);
    if (correlation->min_calibration_accuracy() <= 0.0) correlation->set_min_calibration_accuracy(1.0);
  }

  if (profile.strategy() == relaynorm::runtime::config::DETECTION_STRATEGY_LABELED_FIELD) {
    auto* labeled = profile.mutable_labeled_field();
    FillIfEmpty(labeled->mutable_disabled_markers(), DefaultDisabledMarkers());
    FillIfEmpty(labeled->mutable_enabled_markers(), DefaultEnabledMarkers());
  }

  if (profile.strategy() == relaynorm::runtime::config::DETECTION_STRATEGY_KEYED_SECTION) {
    auto* keyed = profile.mutable_keyed_section();
    if (keyed->activation_key_prefix().empty()) keyed->set_activation_key_prefix("activite_");
    if (keyed->true_values().empty()) {
      keyed->add_true_values("1");
    }
  }
}

} // namespace

void ApplyDefaults(RuntimeConfig& config) {
  auto* batch = config.mutable_batch();
  if (batch->worker_threads() == 0) {
    const unsigned hw = std::thread::hardware_concurrency();
    batch->set_worker_threads(hw == 0 ? 1 : hw);
  }
  if (batch->sniff_bytes() == 0) batch->set_sniff_bytes(4096);
  FillIfEmpty(batch->mutable_encodings(), DefaultEncodings());
  FillIfEmpty(batch->mutable_bundle_suffixes(), DefaultBundleSuffixes());

  auto* normalizer = config.mutable_normalizer();
  FillIfEmpty(normalizer->mutable_known_units(), DefaultKnownUnits());
  FillIfEmpty(normalizer->mutable_true_markers(), DefaultTrueMarkers());
  FillIfEmpty(normalizer->mutable_false_markers(), DefaultFalseMarkers());
  FillIfEmpty(normalizer->mutable_status_patterns(), DefaultStatusPatterns());
  if (normalizer->unit_aliases().empty()) {
    for (const auto& [alias, unit] : DefaultUnitAliases()) {
      (*normalizer->mutable_unit_aliases())[alias] = unit;
    }
  }

  if (config.multipart_patterns().empty()) {
    for (auto& pattern : DefaultMultipartPatterns()) {
      *config.add_multipart_patterns() = std::move(pattern);
    }
  }

  if (config.equipment_patterns().empty()) {
    for (auto& pattern : DefaultEquipmentPatterns()) {
      *config.add_equipment_patterns() = std::move(pattern);
    }
  }

  for (auto& profile : *config.mutable_profiles()) {
    ApplyProfileDefaults(profile);
  }
}

} // namespace relaynorm::config
