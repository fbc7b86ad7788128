#include "internal/normalize/unit_normalizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/defaults.hpp"

namespace {

using relaynorm::model::ValueType;
using relaynorm::normalize::UnitNormalizer;
using relaynorm::normalize::UnitVocabulary;

UnitNormalizer MakeNormalizer() {
  UnitVocabulary vocabulary;
  vocabulary.known_units     = relaynorm::config::DefaultKnownUnits();
  vocabulary.aliases         = relaynorm::config::DefaultUnitAliases();
  vocabulary.true_markers    = relaynorm::config::DefaultTrueMarkers();
  vocabulary.false_markers   = relaynorm::config::DefaultFalseMarkers();
  vocabulary.status_patterns = relaynorm::config::DefaultStatusPatterns();
  return UnitNormalizer(std::move(vocabulary));
}

void TestNumberWithUnit() {
  const auto normalizer = MakeNormalizer();

  const auto hz = normalizer.Normalize("60Hz");
  assert(hz.type == ValueType::kNumeric);
  assert(hz.numeric && *hz.numeric == 60.0);
  assert(hz.numeric_text == "60");
  assert(hz.unit == std::optional<std::string>("Hz"));
  assert(hz.raw == "60Hz");

  const auto spaced = normalizer.Normalize(" 1,5 kA ");
  assert(spaced.type == ValueType::kNumeric);
  assert(spaced.numeric_text == "1.5");
  assert(spaced.unit == std::optional<std::string>("kA"));

  const auto grouped = normalizer.Normalize("1.234,5 V");
  assert(grouped.numeric_text == "1234.5");
  assert(grouped.unit == std::optional<std::string>("V"));
}

void TestDegreeUnits() {
  const auto normalizer = MakeNormalizer();

  const auto celsius = normalizer.Normalize("25°C");
  assert(celsius.type == ValueType::kNumeric);
  assert(celsius.numeric_text == "25");
  assert(celsius.unit == std::optional<std::string>("°C"));

  // masculine ordinal typed instead of the degree sign
  const auto ordinal = normalizer.Normalize("40ºC");
  assert(ordinal.numeric_text == "40");
  assert(ordinal.unit == std::optional<std::string>("°C"));
}

void TestBareNumberHasNoUnit() {
  const auto normalizer = MakeNormalizer();

  const auto plain = normalizer.Normalize("200");
  assert(plain.type == ValueType::kNumeric);
  assert(plain.numeric_text == "200");
  assert(!plain.unit.has_value());

  const auto negative = normalizer.Normalize("-0,5");
  assert(negative.numeric_text == "-0.5");
  assert(negative.numeric && *negative.numeric == -0.5);
}

void TestTextStaysText() {
  const auto normalizer = MakeNormalizer();

  const auto dmt = normalizer.Normalize("DMT");
  assert(dmt.type == ValueType::kText);
  assert(dmt.text == "DMT");
  assert(!dmt.unit.has_value());

  const auto curve = normalizer.Normalize("IEC S Inverse");
  assert(curve.type == ValueType::kText);
  assert(curve.text == "IEC S Inverse");

  const auto empty = normalizer.Normalize("   ");
  assert(empty.type == ValueType::kEmpty);
}

void TestBooleanMarkers() {
  const auto normalizer = MakeNormalizer();

  const auto on = normalizer.Normalize("ON");
  assert(on.type == ValueType::kBoolean);
  assert(on.numeric_text == "1");
  assert(on.text == "ON");

  const auto off = normalizer.Normalize("Disabled");
  assert(off.type == ValueType::kBoolean);
  assert(off.numeric_text == "0");
}

void TestCaseInsensitiveUnitAndAlias() {
  const auto normalizer = MakeNormalizer();

  const auto ms = normalizer.Normalize("5MS");
  assert(ms.type == ValueType::kNumeric);
  assert(ms.unit == std::optional<std::string>("ms"));

  const auto ohm = normalizer.Normalize("10 ohm");
  assert(ohm.numeric_text == "10");
  assert(ohm.unit == std::optional<std::string>("Ω"));
}

void TestAlphabeticSuffixNeedsNumericPrefix() {
  const auto normalizer = MakeNormalizer();

  const auto suffix = normalizer.Normalize("3 pole");
  assert(suffix.type == ValueType::kNumeric);
  assert(suffix.numeric_text == "3");
  assert(suffix.unit == std::optional<std::string>("pole"));

  const auto word = normalizer.Normalize("Pole");
  assert(word.type == ValueType::kText);
}

void TestNormalizeIsIdempotent() {
  const auto normalizer = MakeNormalizer();

  const std::vector<std::string> samples = {
      "60Hz", "25°C", "200", "DMT", "ON", "1,5 kA", "1.234,5 V", "10 ohm", "5MS", "-0,5", "3 pole", "0.02 s", "1e3", "",
  };
  for (const auto& sample : samples) {
    const auto once  = normalizer.Normalize(sample);
    const auto twice = normalizer.Normalize(UnitNormalizer::Render(once));
    assert(once == twice);
    assert(normalizer.Renormalize(once) == once);
  }
}

void TestStatusFieldsStayText() {
  const auto normalizer = MakeNormalizer();

  assert(normalizer.IsStatusField("Opto Input Status"));
  assert(!normalizer.IsStatusField("I>1 Current Set"));

  const auto status = normalizer.NormalizeField("Opto Input Status", "00000110");
  assert(status.type == ValueType::kText);
  assert(status.text == "00000110");

  const auto setting = normalizer.NormalizeField("I>1 Current Set", "00000110");
  assert(setting.type == ValueType::kNumeric);
}

void TestParseSignedDecimal() {
  assert(UnitNormalizer::ParseSignedDecimal("+3") == std::optional<std::string>("3"));
  assert(UnitNormalizer::ParseSignedDecimal("1,234,567") == std::optional<std::string>("1234567"));
  assert(UnitNormalizer::ParseSignedDecimal("1,234.5") == std::optional<std::string>("1234.5"));
  assert(UnitNormalizer::ParseSignedDecimal(".5") == std::optional<std::string>("0.5"));
  assert(UnitNormalizer::ParseSignedDecimal("1e3") == std::optional<std::string>("1e3"));
  assert(!UnitNormalizer::ParseSignedDecimal("12,34,5").has_value());
  assert(!UnitNormalizer::ParseSignedDecimal("abc").has_value());
  assert(!UnitNormalizer::ParseSignedDecimal("-").has_value());
}

void TestProfileUnitsExtendVocabulary() {
  const auto base     = MakeNormalizer();
  const auto extended = base.WithAdditionalUnits({"xIn"});

  const auto value = extended.Normalize("1.2xIn");
  assert(value.type == ValueType::kNumeric);
  assert(value.numeric_text == "1.2");
  assert(value.unit == std::optional<std::string>("xIn"));
}

} // namespace

int main() {
  TestNumberWithUnit();
  TestDegreeUnits();
  TestBareNumberHasNoUnit();
  TestTextStaysText();
  TestBooleanMarkers();
  TestCaseInsensitiveUnitAndAlias();
  TestAlphabeticSuffixNeedsNumericPrefix();
  TestNormalizeIsIdempotent();
  TestStatusFieldsStayText();
  TestParseSignedDecimal();
  TestProfileUnitsExtendVocabulary();

  std::cout << "relaynorm_unit_unit_normalizer: pass\n";
  return 0;
}
