#pragma once

#include <vector>

#include <google/protobuf/repeated_ptr_field.h>
#include <opencv2/core.hpp>

#include "internal/model/checkbox_mark.hpp"
#include "relaynorm/v1/page_bundle.pb.h"

namespace relaynorm::runtime::config {
class CheckboxConfig;
}

namespace relaynorm::detect {

struct CheckboxSettings {
  double density_threshold      = 0.316;
  int    min_size_px            = 10;
  int    max_size_px            = 40;
  double max_aspect_deviation   = 0.3;
  int    interior_inset_px      = 3;
  int    binarize_threshold     = 128;
  double min_border_coverage    = 0.8;
  double max_saturation         = 40.0;
  int    text_mask_margin_px    = 1;
  bool   auto_threshold         = false;
  double auto_min_iqr           = 0.2;
  double auto_iqr_fraction      = 0.2;
  double auto_threshold_floor   = 0.25;
  double auto_threshold_ceiling = 0.40;

  static CheckboxSettings FromConfig(const relaynorm::runtime::config::CheckboxConfig& config);
};

/*
  CheckboxDetector

  Finds square outline controls on a rendered page and classifies
  them by interior fill.

    binarize -> blank text glyph boxes -> 8-connected dark components
    -> square-ish with all four borders inked -> reject coloured icons
    -> interior density -> marked if above threshold

  The page is 8-bit gray or BGR. Text runs are mapped to pixels by
  dividing by text_units_per_pixel. Overlapping candidates are
  collapsed to the larger one. An empty result is a normal outcome for
  text-only pages.
*/
class CheckboxDetector {
 public:
  explicit CheckboxDetector(CheckboxSettings settings);

  std::vector<model::CheckboxMark> Detect(const cv::Mat&                                                    page,
                                          const google::protobuf::RepeatedPtrField<relaynorm::v1::TextRun>& runs,
                                          double text_units_per_pixel) const;

  // Configured threshold, or the page-adaptive one when auto mode is
  // on and the densities are clearly bimodal.
  double EffectiveThreshold(const std::vector<double>& densities) const;

  const CheckboxSettings& Settings() const {
    return settings_;
  }

 private:
  CheckboxSettings settings_;
};

} // namespace relaynorm::detect
