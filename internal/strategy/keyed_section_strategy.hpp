#pragma once

#include <string>
#include <vector>

#include "internal/strategy/detection_strategy.hpp"
#include "internal/strategy/ini_document.hpp"

namespace relaynorm::runtime::config {
class RelayModelProfile;
}

namespace relaynorm::strategy {

/*
  Keyed-section detection (SEPAM style INI exports).

  A function is active when at least one numbered activation key in
  its section is true:

    [Protection 50/51]
    activite_0=0
    activite_1=1     -> active, group_index 1

  Missing sections and keys read as false. Without configured
  functions every section carrying activation keys is reported.

  Every entry with a value is also a setting, coded "Section.key"
  (bare key before the first header).
*/
class KeyedSectionStrategy final : public DetectionStrategy {
 public:
  explicit KeyedSectionStrategy(const relaynorm::runtime::config::RelayModelProfile& profile);

  model::DetectionMethod Method() const override {
    return model::DetectionMethod::kKeyedSection;
  }

  std::vector<model::ActiveFlagResult> Detect(const DocumentContent& content, std::vector<ReviewNote>& notes) const override;

  std::optional<std::vector<model::ParameterLine>> StructuredLines(const DocumentContent& content) const override;

  std::optional<std::string> EquipmentHint(const DocumentContent& content) const override;

  // lowest true activation index of a section, or nullopt
  std::optional<int> ActiveGroup(const IniDocument::Section& section) const;

 private:
  struct Function {
    std::string code;
    std::string description;
    std::string section;
  };

  std::optional<int> ActivationIndex(const std::string& key) const;

  std::vector<Function>    functions_;
  std::string              prefix_;
  std::vector<std::string> true_values_;
  std::string              hint_section_;
  std::string              hint_key_;
};

} // namespace relaynorm::strategy
