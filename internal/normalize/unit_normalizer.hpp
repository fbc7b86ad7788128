#pragma once

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/normalized_value.hpp"

namespace relaynorm::runtime::config {
class NormalizerConfig;
}

namespace relaynorm::normalize {

struct UnitVocabulary {
  std::vector<std::string>           known_units;
  std::map<std::string, std::string> aliases; // alias -> canonical unit
  std::vector<std::string>           true_markers;
  std::vector<std::string>           false_markers;
  std::vector<std::string>           status_patterns;

  static UnitVocabulary FromConfig(const relaynorm::runtime::config::NormalizerConfig& config);
};

/*
  UnitNormalizer

  Atomizes a raw cell into (value, unit, type). Fallback chain, first
  match wins:

    boolean marker          "ON"      -> 1, boolean
    degree unit             "25°C"    -> 25 °C
    known unit, exact case  "60Hz"    -> 60 Hz
    known unit, any case    "5MS"     -> 5 ms
    alphabetic suffix       "5 cyc"   -> 5 cyc   (prefix must be a number)
    plain number            "200"     -> 200
    anything else           "DMT"     -> text

  Normalize(Render(Normalize(x))) == Normalize(x) for every x.

  Instances are immutable and safe to share between workers.
*/
class UnitNormalizer {
 public:
  explicit UnitNormalizer(UnitVocabulary vocabulary);

  model::NormalizedValue Normalize(std::string_view raw) const;

  // Same as Normalize but keeps the value as text when the description
  // names a status / bit-mask field.
  model::NormalizedValue NormalizeField(std::string_view description, std::string_view raw) const;

  // Returns an already-atomized value unchanged. Logs if running it
  // through the chain again would have produced something different.
  model::NormalizedValue Renormalize(const model::NormalizedValue& value) const;

  bool IsStatusField(std::string_view description) const;

  // Copy with extra units (per-profile vocabulary additions).
  UnitNormalizer WithAdditionalUnits(const std::vector<std::string>& units) const;

  static std::string Render(const model::NormalizedValue& value);

  // Canonical spelling of a signed decimal, or nullopt. Accepts ',' or
  // '.' as decimal separator and 1,234.5 / 1.234,5 grouping.
  static std::optional<std::string> ParseSignedDecimal(std::string_view text);

 private:
  struct Unit {
    std::string spelling;  // as matched against the input
    std::string canonical; // as stored
  };

  std::optional<model::NormalizedValue> MatchBoolean(const std::string& trimmed) const;
  std::optional<model::NormalizedValue> MatchDegree(const std::string& trimmed) const;
  std::optional<model::NormalizedValue> MatchKnownUnit(const std::string& trimmed) const;
  std::optional<model::NormalizedValue> MatchAlphabeticSuffix(const std::string& trimmed) const;

  UnitVocabulary          vocabulary_;
  std::vector<Unit>       units_; // longest spelling first
  std::vector<std::regex> status_patterns_;
};

} // namespace relaynorm::normalize
