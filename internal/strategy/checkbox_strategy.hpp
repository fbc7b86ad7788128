#pragma once

#include <string>
#include <vector>

#include "internal/detect/checkbox_correlator.hpp"
#include "internal/detect/checkbox_detector.hpp"
#include "internal/strategy/detection_strategy.hpp"

namespace relaynorm::runtime::config {
class RelayModelProfile;
}

namespace relaynorm::strategy {

/*
  Checkbox detection for rendered settings pages.

  Per page: detect checkboxes on the raster, correlate them with the
  page's parameter lines and report each matched line's marked state
  under the line's code. Ambiguous matches are left out unless the
  profile opts in; they and unmatched checkboxes become review notes.
*/
class CheckboxStrategy final : public DetectionStrategy {
 public:
  explicit CheckboxStrategy(const relaynorm::runtime::config::RelayModelProfile& profile);

  model::DetectionMethod Method() const override {
    return model::DetectionMethod::kCheckbox;
  }

  std::vector<model::ActiveFlagResult> Detect(const DocumentContent& content, std::vector<ReviewNote>& notes) const override;

  // correlation step alone, for pages whose marks are already known
  std::vector<model::ActiveFlagResult> Correlate(const PageContent&                     page,
                                                 const std::vector<model::CheckboxMark>& marks,
                                                 std::vector<ReviewNote>&                notes) const;

 private:
  std::string                profile_name_;
  detect::CheckboxDetector   detector_;
  detect::CheckboxCorrelator correlator_;
};

} // namespace relaynorm::strategy
