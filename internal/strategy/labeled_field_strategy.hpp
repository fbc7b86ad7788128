#pragma once

#include <string>
#include <vector>

#include "internal/strategy/detection_strategy.hpp"

namespace relaynorm::runtime::config {
class RelayModelProfile;
}

namespace relaynorm::strategy {

/*
  Labeled-field detection (MiCOM P14x style text exports).

    I>1 Function:
    IEC S Inverse        -> active (any non-disabled marker)

  The marker is the text after the label on the same line, or the next
  non-empty line. Several label variants per function are allowed;
  group_index is the index of the variant that proved it active.
*/
class LabeledFieldStrategy final : public DetectionStrategy {
 public:
  explicit LabeledFieldStrategy(const relaynorm::runtime::config::RelayModelProfile& profile);

  model::DetectionMethod Method() const override {
    return model::DetectionMethod::kLabeledField;
  }

  std::vector<model::ActiveFlagResult> Detect(const DocumentContent& content, std::vector<ReviewNote>& notes) const override;

  // true/false for a marker; unknown markers follow the profile default
  bool MarkerIsActive(const std::string& marker) const;

 private:
  struct Function {
    std::string              code;
    std::string              description;
    std::vector<std::string> labels; // folded
  };

  std::optional<std::string> FindMarker(const std::vector<std::string>& lines, const std::string& folded_label) const;
  bool                       StartsWithAnyLabel(const std::string& folded_line) const;

  std::vector<Function>    functions_;
  std::vector<std::string> disabled_markers_;
  std::vector<std::string> enabled_markers_;
  bool                     unknown_is_active_ = true;
};

} // namespace relaynorm::strategy
