#include "unit_normalizer.hpp"

#include <algorithm>
#include <cstdlib>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::normalize {

using model::NormalizedValue;
using model::ValueType;
using observability::StringField;

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsAsciiAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool AllDigits(std::string_view s) {
  return std::all_of(s.begin(), s.end(), IsDigit);
}

// "1", "12", "123" followed by groups of exactly three digits
bool IsGroupedInteger(std::string_view s, char separator, std::string* digits) {
  std::size_t start = 0;
  bool        first = true;
  digits->clear();
  while (true) {
    const auto        pos   = s.find(separator, start);
    const std::string group = std::string(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
    if (group.empty() || !AllDigits(group)) return false;
    if (first ? group.size() > 3 : group.size() != 3) return false;
    digits->append(group);
    first = false;
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return true;
}

NormalizedValue MakeNumeric(std::string canonical, std::optional<std::string> unit, std::string_view raw) {
  NormalizedValue value;
  value.type         = ValueType::kNumeric;
  value.numeric      = std::strtod(canonical.c_str(), nullptr);
  value.numeric_text = std::move(canonical);
  value.unit         = std::move(unit);
  value.raw          = std::string(raw);
  return value;
}

std::optional<std::string> ParsePrefix(const std::string& trimmed, std::size_t suffix_size) {
  if (suffix_size >= trimmed.size()) return std::nullopt;
  return UnitNormalizer::ParseSignedDecimal(util::Trim(std::string_view(trimmed).substr(0, trimmed.size() - suffix_size)));
}

} // namespace

// ---------------------------------------------------------------------
// Vocabulary
// ---------------------------------------------------------------------

UnitVocabulary UnitVocabulary::FromConfig(const relaynorm::runtime::config::NormalizerConfig& config) {
  UnitVocabulary vocabulary;
  vocabulary.known_units.assign(config.known_units().begin(), config.known_units().end());
  for (const auto& [alias, unit] : config.unit_aliases()) {
    vocabulary.aliases[alias] = unit;
  }
  vocabulary.true_markers.assign(config.true_markers().begin(), config.true_markers().end());
  vocabulary.false_markers.assign(config.false_markers().begin(), config.false_markers().end());
  vocabulary.status_patterns.assign(config.status_patterns().begin(), config.status_patterns().end());
  return vocabulary;
}

// ---------------------------------------------------------------------
// UnitNormalizer
// ---------------------------------------------------------------------

UnitNormalizer::UnitNormalizer(UnitVocabulary vocabulary) : vocabulary_(std::move(vocabulary)) {
  auto canonical_of = [this](const std::string& spelling) {
    auto it = vocabulary_.aliases.find(spelling);
    return it == vocabulary_.aliases.end() ? spelling : it->second;
  };

  for (const auto& unit : vocabulary_.known_units) {
    if (unit.empty()) continue;
    units_.push_back({unit, canonical_of(unit)});
  }
  for (const auto& [alias, unit] : vocabulary_.aliases) {
    const bool listed = std::any_of(units_.begin(), units_.end(), [&](const Unit& u) { return u.spelling == alias; });
    if (!listed && !alias.empty()) units_.push_back({alias, unit});
  }

  std::stable_sort(units_.begin(), units_.end(), [](const Unit& a, const Unit& b) { return a.spelling.size() > b.spelling.size(); });

  for (const auto& pattern : vocabulary_.status_patterns) {
    status_patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
  }
}

UnitNormalizer UnitNormalizer::WithAdditionalUnits(const std::vector<std::string>& units) const {
  UnitVocabulary extended = vocabulary_;
  for (const auto& unit : units) {
    if (std::find(extended.known_units.begin(), extended.known_units.end(), unit) == extended.known_units.end()) {
      extended.known_units.push_back(unit);
    }
  }
  return UnitNormalizer(std::move(extended));
}

std::optional<std::string> UnitNormalizer::ParseSignedDecimal(std::string_view text) {
  if (text.empty()) return std::nullopt;

  std::string sign;
  std::size_t i = 0;
  if (text[0] == '+' || text[0] == '-') {
    if (text[0] == '-') sign = "-";
    i = 1;
  }

  std::string_view body     = text.substr(i);
  std::string_view exponent;
  const auto       exp_pos = body.find_first_of("eE");
  if (exp_pos != std::string_view::npos) {
    exponent = body.substr(exp_pos + 1);
    body     = body.substr(0, exp_pos);
    std::string_view exp_digits = exponent;
    if (!exp_digits.empty() && (exp_digits[0] == '+' || exp_digits[0] == '-')) exp_digits.remove_prefix(1);
    if (exp_digits.empty() || !AllDigits(exp_digits)) return std::nullopt;
  }

  if (body.empty() || !std::any_of(body.begin(), body.end(), IsDigit)) return std::nullopt;
  for (char c : body) {
    if (!IsDigit(c) && c != '.' && c != ',') return std::nullopt;
  }

  const auto dots   = std::count(body.begin(), body.end(), '.');
  const auto commas = std::count(body.begin(), body.end(), ',');

  std::string integer_part;
  std::string fraction_part;

  if (dots == 0 && commas == 0) {
    integer_part = std::string(body);
  } else if (dots > 0 && commas > 0) {
    const auto  last    = body.find_last_of(".,");
    const char  decimal = body[last];
    const char  group   = decimal == '.' ? ',' : '.';
    if (std::count(body.begin(), body.end(), decimal) != 1) return std::nullopt;
    if (!exponent.empty()) return std::nullopt;
    if (!IsGroupedInteger(body.substr(0, last), group, &integer_part)) return std::nullopt;
    fraction_part = std::string(body.substr(last + 1));
    if (!AllDigits(fraction_part)) return std::nullopt;
  } else {
    const char separator = dots > 0 ? '.' : ',';
    if ((dots > 0 ? dots : commas) == 1) {
      const auto pos = body.find(separator);
      integer_part   = std::string(body.substr(0, pos));
      fraction_part  = std::string(body.substr(pos + 1));
    } else {
      if (!exponent.empty()) return std::nullopt;
      if (!IsGroupedInteger(body, separator, &integer_part)) return std::nullopt;
    }
  }

  if (integer_part.empty()) integer_part = "0";

  std::string canonical = sign + integer_part;
  if (!fraction_part.empty()) canonical += "." + fraction_part;
  if (!exponent.empty()) canonical += "e" + std::string(exponent);
  return canonical;
}

std::optional<NormalizedValue> UnitNormalizer::MatchBoolean(const std::string& trimmed) const {
  const auto folded = util::FoldCase(trimmed);
  auto       in     = [&](const std::vector<std::string>& markers) {
    return std::any_of(markers.begin(), markers.end(), [&](const std::string& m) { return util::FoldCase(m) == folded; });
  };

  std::optional<bool> flag;
  if (in(vocabulary_.true_markers)) {
    flag = true;
  } else if (in(vocabulary_.false_markers)) {
    flag = false;
  }
  if (!flag) return std::nullopt;

  NormalizedValue value;
  value.type         = ValueType::kBoolean;
  value.numeric      = *flag ? 1.0 : 0.0;
  value.numeric_text = *flag ? "1" : "0";
  value.text         = trimmed;
  return value;
}

std::optional<NormalizedValue> UnitNormalizer::MatchDegree(const std::string& trimmed) const {
  static const std::pair<const char*, const char*> kDegrees[] = {
      {"°C", "°C"},
      {"°F", "°F"},
      {"ºC", "°C"},
      {"ºF", "°F"},
  };
  for (const auto& [spelling, canonical] : kDegrees) {
    const std::string_view suffix(spelling);
    if (!util::EndsWithFolded(trimmed, suffix)) continue;
    if (auto number = ParsePrefix(trimmed, suffix.size())) {
      return MakeNumeric(std::move(*number), std::string(canonical), {});
    }
  }
  return std::nullopt;
}

std::optional<NormalizedValue> UnitNormalizer::MatchKnownUnit(const std::string& trimmed) const {
  for (const auto& unit : units_) {
    if (trimmed.size() <= unit.spelling.size()) continue;
    if (trimmed.compare(trimmed.size() - unit.spelling.size(), unit.spelling.size(), unit.spelling) != 0) continue;
    if (auto number = ParsePrefix(trimmed, unit.spelling.size())) {
      return MakeNumeric(std::move(*number), unit.canonical, {});
    }
  }
  for (const auto& unit : units_) {
    if (!util::EndsWithFolded(trimmed, unit.spelling)) continue;
    if (auto number = ParsePrefix(trimmed, unit.spelling.size())) {
      return MakeNumeric(std::move(*number), unit.canonical, {});
    }
  }
  return std::nullopt;
}

std::optional<NormalizedValue> UnitNormalizer::MatchAlphabeticSuffix(const std::string& trimmed) const {
  std::size_t start = trimmed.size();
  while (start > 0 && IsAsciiAlpha(trimmed[start - 1])) --start;
  if (start == trimmed.size() || start == 0) return std::nullopt;

  if (auto number = ParsePrefix(trimmed, trimmed.size() - start)) {
    return MakeNumeric(std::move(*number), trimmed.substr(start), {});
  }
  return std::nullopt;
}

NormalizedValue UnitNormalizer::Normalize(std::string_view raw) const {
  const std::string trimmed = util::Trim(raw);

  auto finish = [&](NormalizedValue value) {
    value.raw = std::string(raw);
    return value;
  };

  if (trimmed.empty()) return finish({});

  if (auto value = MatchBoolean(trimmed)) return finish(std::move(*value));
  if (auto value = MatchDegree(trimmed)) return finish(std::move(*value));
  if (auto value = MatchKnownUnit(trimmed)) return finish(std::move(*value));
  if (auto value = MatchAlphabeticSuffix(trimmed)) return finish(std::move(*value));

  if (auto number = ParseSignedDecimal(trimmed)) {
    return finish(MakeNumeric(std::move(*number), std::nullopt, {}));
  }

  NormalizedValue text;
  text.type = ValueType::kText;
  text.text = trimmed;
  return finish(std::move(text));
}

bool UnitNormalizer::IsStatusField(std::string_view description) const {
  const std::string text(description);
  return std::any_of(status_patterns_.begin(), status_patterns_.end(), [&](const std::regex& re) { return std::regex_search(text, re); });
}

NormalizedValue UnitNormalizer::NormalizeField(std::string_view description, std::string_view raw) const {
  if (IsStatusField(description)) {
    NormalizedValue value;
    value.raw  = std::string(raw);
    value.text = util::Trim(raw);
    value.type = value.text.empty() ? ValueType::kEmpty : ValueType::kText;
    return value;
  }
  return Normalize(raw);
}

NormalizedValue UnitNormalizer::Renormalize(const NormalizedValue& value) const {
  if (value.type == ValueType::kEmpty) return value;

  const auto again = Normalize(Render(value));
  if (!(again == value)) {
    RELAYNORM_LOG_DEBUG("Value already atomized; left unchanged",
                        {StringField("value", Render(value)), StringField("type", model::ToString(value.type)),
                         StringField("would_become", model::ToString(again.type))});
  }
  return value;
}

std::string UnitNormalizer::Render(const NormalizedValue& value) {
  switch (value.type) {
    case ValueType::kNumeric:
      return value.numeric_text + value.unit.value_or("");
    case ValueType::kBoolean:
    case ValueType::kText:
      return value.text;
    case ValueType::kEmpty:
      break;
  }
  return {};
}

} // namespace relaynorm::normalize
