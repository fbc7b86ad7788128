#include "internal/strategy/keyed_section_strategy.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/strategy/ini_document.hpp"

namespace {

using relaynorm::model::DetectionMethod;
using relaynorm::runtime::config::RelayModelProfile;
using relaynorm::strategy::DocumentContent;
using relaynorm::strategy::IniDocument;
using relaynorm::strategy::KeyedSectionStrategy;
using relaynorm::strategy::ReviewNote;

constexpr const char* kExport =
    "; SEPAM series 40 export\n"
    "[Identification]\n"
    "repere = TR-204\n"
    "type=S40\n"
    "\n"
    "[Protection 50/51]\n"
    "activite_0=0\n"
    "activite_1=1\n"
    "activite_2=0\n"
    "seuil_0=1.5\n"
    "\n"
    "[protection 46]\n"
    "ACTIVITE_0 = 0\n"
    "activite_1=0\n"
    "\n"
    "[Protection 27]\n"
    "seuil_0=0.8\n"
    "\n"
    "[Protection 50/51]\n"
    "activite_3=1\n";

RelayModelProfile SepamProfile(bool with_functions) {
  RelayModelProfile profile;
  profile.set_name("sepam_s40");
  profile.set_strategy(relaynorm::runtime::config::DETECTION_STRATEGY_KEYED_SECTION);
  auto* keyed = profile.mutable_keyed_section();
  keyed->set_activation_key_prefix("activite_");
  keyed->add_true_values("1");
  keyed->set_equipment_hint_section("Identification");
  keyed->set_equipment_hint_key("repere");

  if (with_functions) {
    auto add = [&](const std::string& code, const std::string& section) {
      auto* function = profile.add_functions();
      function->set_code(code);
      function->set_section(section);
    };
    add("50/51", "Protection 50/51");
    add("46", "Protection 46");
    add("27", "Protection 27");
    add("49RMS", "Protection 49RMS");
  }
  return profile;
}

DocumentContent Ini(const std::string& text) {
  DocumentContent content;
  content.document.file_name = "TR-204.S40";
  content.text               = text;
  return content;
}

void TestIniDocument() {
  const auto doc = IniDocument::Parse(kExport);
  assert(doc.SectionCount() == 4);
  assert(doc.Value("identification", "REPERE") == std::optional<std::string>("TR-204"));
  assert(!doc.Value("Identification", "missing").has_value());
  assert(!doc.Value("Nowhere", "repere").has_value());

  // duplicate headers merge
  const auto* section = doc.Find("PROTECTION 50/51");
  assert(section != nullptr);
  assert(section->entries.size() == 5);

  const auto loose = IniDocument::Parse("key=value\n[A]\nb=c\n");
  assert(loose.SectionCount() == 1);
  assert(loose.Value("", "key") == std::optional<std::string>("value"));
}

void TestConfiguredFunctions() {
  KeyedSectionStrategy strategy(SepamProfile(true));

  std::vector<ReviewNote> notes;
  const auto              flags = strategy.Detect(Ini(kExport), notes);
  assert(notes.empty());
  assert(flags.size() == 4);

  assert(flags[0].function_code == "50/51");
  assert(flags[0].active);
  assert(flags[0].group_index == std::optional<int>(1));
  assert(flags[0].method == DetectionMethod::kKeyedSection);
  assert(flags[0].description == "Protection 50/51");

  assert(flags[1].function_code == "46");
  assert(!flags[1].active);
  assert(!flags[1].group_index.has_value());

  // section present without activation keys
  assert(!flags[2].active);

  // section absent
  assert(flags[3].function_code == "49RMS");
  assert(!flags[3].active);
}

void TestActiveGroupPicksLowestIndex() {
  KeyedSectionStrategy strategy(SepamProfile(true));

  const auto doc = IniDocument::Parse("[S]\nactivite_4=1\nactivite_2=1\nactivite_x=1\nactivite_=1\nactivite_0=yes\n");
  const auto group = strategy.ActiveGroup(*doc.Find("S"));
  assert(group == std::optional<int>(2));
}

void TestDiscoversSectionsWithoutFunctions() {
  KeyedSectionStrategy strategy(SepamProfile(false));

  std::vector<ReviewNote> notes;
  const auto              flags = strategy.Detect(Ini(kExport), notes);
  assert(flags.size() == 2);
  assert(flags[0].function_code == "Protection 50/51");
  assert(flags[0].active);
  assert(flags[1].function_code == "protection 46");
  assert(!flags[1].active);
}

void TestEquipmentHint() {
  KeyedSectionStrategy strategy(SepamProfile(true));

  assert(strategy.EquipmentHint(Ini(kExport)) == std::optional<std::string>("TR-204"));
  assert(!strategy.EquipmentHint(Ini("[Identification]\nrepere =  \n")).has_value());
  assert(!strategy.EquipmentHint(Ini("[Other]\nrepere=X\n")).has_value());

  RelayModelProfile no_hint = SepamProfile(true);
  no_hint.mutable_keyed_section()->clear_equipment_hint_key();
  assert(!KeyedSectionStrategy(no_hint).EquipmentHint(Ini(kExport)).has_value());
}

void TestEntriesBecomeParameterLines() {
  KeyedSectionStrategy strategy(SepamProfile(true));

  const auto lines = strategy.StructuredLines(Ini(kExport));
  assert(lines.has_value());
  assert(lines->size() == 10);

  assert((*lines)[0].code == "Identification.repere");
  assert((*lines)[0].description == "repere");
  assert((*lines)[0].raw_value == "TR-204");
  assert((*lines)[0].page_index == 0);

  assert((*lines)[5].code == "Protection 50/51.seuil_0");
  assert((*lines)[5].raw_value == "1.5");
  // merged duplicate header keeps the first spelling
  assert((*lines)[6].code == "Protection 50/51.activite_3");
  assert((*lines)[7].code == "protection 46.ACTIVITE_0");
  assert((*lines)[9].code == "Protection 27.seuil_0");
  assert((*lines)[9].raw_value == "0.8");
  for (std::size_t i = 1; i < lines->size(); ++i) assert((*lines)[i].y > (*lines)[i - 1].y);

  // empty values and comment lines are not settings; bare keys keep their name
  const auto sparse = strategy.StructuredLines(Ini("mode=local\n; note\n[S]\nblank=\nIs_0=2\n"));
  assert(sparse->size() == 2);
  assert((*sparse)[0].code == "mode");
  assert((*sparse)[1].code == "S.Is_0");

  assert(strategy.StructuredLines(Ini("no sections here\n"))->empty());
}

} // namespace

int main() {
  TestIniDocument();
  TestConfiguredFunctions();
  TestActiveGroupPicksLowestIndex();
  TestDiscoversSectionsWithoutFunctions();
  TestEquipmentHint();
  TestEntriesBecomeParameterLines();

  std::cout << "relaynorm_unit_keyed_section_strategy: pass\n";
  return 0;
}
