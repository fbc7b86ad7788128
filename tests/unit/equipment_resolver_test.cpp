#include "internal/normalize/equipment_resolver.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/config/defaults.hpp"
#include "internal/util/errors.hpp"

namespace {

using relaynorm::normalize::EquipmentResolver;
using relaynorm::runtime::config::RuntimeConfig;

RuntimeConfig DefaultPatterns() {
  RuntimeConfig config;
  for (auto& pattern : relaynorm::config::DefaultEquipmentPatterns()) {
    *config.add_equipment_patterns() = std::move(pattern);
  }
  return config;
}

void TestFileNameConventions() {
  const auto        config = DefaultPatterns();
  EquipmentResolver resolver(config.equipment_patterns());

  const auto sepam = resolver.FromFileName("52-DJ-01A_export.S40");
  assert(sepam.has_value());
  assert(sepam->tag == "52-DJ-01A");
  assert(sepam->substation == "52");
  assert(sepam->device_type == "DJ");
  assert(sepam->position == "01A");
  assert(sepam->source == "filename");

  const auto micom_spaced = resolver.FromFileName("P143 12-SL-04 settings.txt");
  assert(micom_spaced.has_value());
  assert(micom_spaced->tag == "12-SL-04");

  const auto micom_underscore = resolver.FromFileName("P143_12-SL-04.txt");
  assert(micom_underscore.has_value());
  assert(micom_underscore->tag == "12-SL-04");

  assert(!resolver.FromFileName("settings_backup.txt").has_value());
}

void TestFirstMatchingPatternWins() {
  RuntimeConfig config;
  auto*         first = config.add_equipment_patterns();
  first->set_name("bay");
  first->set_regex(R"(BAY(\d+))");
  first->set_tag_format("BAY-{1}");
  auto* second = config.add_equipment_patterns();
  second->set_name("any_number");
  second->set_regex(R"((\d+))");

  EquipmentResolver resolver(config.equipment_patterns());
  const auto        identity = resolver.FromFileName("BAY7_rev3.txt");
  assert(identity.has_value());
  assert(identity->tag == "BAY-7");
  assert(identity->substation.empty());
}

void TestContentHintOverridesFileName() {
  const auto        config = DefaultPatterns();
  EquipmentResolver resolver(config.equipment_patterns());

  const auto identity = resolver.Resolve("52-DJ-01_copy.S40", std::optional<std::string>(" 52-DJ-02 "));
  assert(identity.has_value());
  assert(identity->tag == "52-DJ-02");
  assert(identity->position == "02");
  assert(identity->source == "content");

  const auto free_text = resolver.Resolve("unnamed.S40", std::optional<std::string>("FEEDER NORTH"));
  assert(free_text.has_value());
  assert(free_text->tag == "FEEDER NORTH");
  assert(free_text->source == "content");
}

void TestBlankHintFallsBackToFileName() {
  const auto        config = DefaultPatterns();
  EquipmentResolver resolver(config.equipment_patterns());

  const auto identity = resolver.Resolve("52-DJ-01_export.S40", std::optional<std::string>("   "));
  assert(identity.has_value());
  assert(identity->tag == "52-DJ-01");
  assert(identity->source == "filename");

  assert(!resolver.Resolve("unnamed.S40", std::nullopt).has_value());
}

void TestInvalidPatternIsRejected() {
  RuntimeConfig config;
  auto*         pattern = config.add_equipment_patterns();
  pattern->set_name("broken");
  pattern->set_regex("([A-Z]+");

  bool threw = false;
  try {
    EquipmentResolver resolver(config.equipment_patterns());
  } catch (const relaynorm::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFileNameConventions();
  TestFirstMatchingPatternWins();
  TestContentHintOverridesFileName();
  TestBlankHintFallsBackToFileName();
  TestInvalidPatternIsRejected();

  std::cout << "relaynorm_unit_equipment_resolver: pass\n";
  return 0;
}
