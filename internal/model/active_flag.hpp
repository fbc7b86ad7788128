#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace relaynorm::model {

enum class DetectionMethod {
  kCheckbox,
  kLabeledField,
  kKeyedSection,
};

inline std::string_view ToString(DetectionMethod method) {
  switch (method) {
    case DetectionMethod::kCheckbox:
      return "checkbox";
    case DetectionMethod::kLabeledField:
      return "labeled_field";
    case DetectionMethod::kKeyedSection:
      return "keyed_section";
  }
  return "checkbox";
}

inline std::optional<DetectionMethod> DetectionMethodFromString(std::string_view name) {
  if (name == "checkbox") return DetectionMethod::kCheckbox;
  if (name == "labeled_field") return DetectionMethod::kLabeledField;
  if (name == "keyed_section") return DetectionMethod::kKeyedSection;
  return std::nullopt;
}

/*
  Outcome of active-function detection for a single function.

  method is stamped by the strategy that produced the result.
*/
struct ActiveFlagResult {
  std::string        function_code;
  std::string        description;
  bool               active = false;
  DetectionMethod    method = DetectionMethod::kCheckbox;
  std::optional<int> group_index;
  bool               ambiguous = false;
};

} // namespace relaynorm::model
