#include "checkbox_strategy.hpp"

#include <cmath>
#include <iterator>
#include <sstream>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/raster/page_raster.hpp"

namespace relaynorm::strategy {

using model::ActiveFlagResult;
using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

CheckboxStrategy::CheckboxStrategy(const relaynorm::runtime::config::RelayModelProfile& profile)
    : profile_name_(profile.name()),
      detector_(detect::CheckboxSettings::FromConfig(profile.checkbox())),
      correlator_(detect::CorrelationSettings::FromConfig(profile.correlation())) {
}

std::vector<ActiveFlagResult> CheckboxStrategy::Correlate(const PageContent&                     page,
                                                          const std::vector<model::CheckboxMark>& marks,
                                                          std::vector<ReviewNote>&                notes) const {
  const auto correlation = correlator_.Correlate(marks, page.lines);
  const auto page_index  = page.layer.index();

  std::vector<ActiveFlagResult> results;
  for (const auto& match : correlation.matches) {
    const auto& line = page.lines[match.line_index];
    const auto& mark = marks[match.checkbox_index];

    if (match.ambiguous) {
      std::ostringstream detail;
      detail << "checkbox at (" << mark.center_x << "," << mark.center_y << ") px is equally close to more than one line";
      notes.push_back({relaynorm::v1::REVIEW_KIND_DETECTION_AMBIGUOUS, detail.str(), page_index, line.code});
      RELAYNORM_LOG_WARN("Ambiguous checkbox match",
                         {StringField("profile", profile_name_), IntField("page", page_index), StringField("code", line.code), DoubleField("distance", match.distance)});
      if (!correlator_.Settings().include_ambiguous) continue;
    }

    ActiveFlagResult result;
    result.function_code = line.code;
    result.description   = line.description;
    result.active        = mark.marked;
    result.method        = Method();
    result.ambiguous     = match.ambiguous;
    results.push_back(std::move(result));
  }

  for (auto index : correlation.unmatched_checkboxes) {
    const auto&        mark = marks[index];
    std::ostringstream detail;
    detail << "checkbox at (" << mark.center_x << "," << mark.center_y << ") px has no parameter line within tolerance"
           << (mark.marked ? " (marked)" : "");
    notes.push_back({relaynorm::v1::REVIEW_KIND_UNMATCHED_CHECKBOX, detail.str(), page_index, {}});
    RELAYNORM_LOG_WARN("Unmatched checkbox",
                       {StringField("profile", profile_name_), IntField("page", page_index), DoubleField("x", mark.center_x),
                        DoubleField("y", mark.center_y), BoolField("marked", mark.marked)});
  }
  return results;
}

std::vector<ActiveFlagResult> CheckboxStrategy::Detect(const DocumentContent& content, std::vector<ReviewNote>& notes) const {
  std::vector<ActiveFlagResult> results;

  for (const auto& page : content.pages) {
    const auto page_index = page.layer.index();
    if (page.lines.empty()) continue;

    if (page.raster_path.empty()) {
      notes.push_back({relaynorm::v1::REVIEW_KIND_PROCESSING_ERROR, "parametric page has no raster", page_index, {}});
      RELAYNORM_LOG_WARN("Parametric page without raster", {StringField("file", content.document.file_name), IntField("page", page_index)});
      continue;
    }

    const double scale = correlator_.Settings().coordinate_scale;
    if (page.layer.raster_dpi() > 0.0 && page.layer.text_dpi() > 0.0) {
      const double page_scale = page.layer.text_dpi() / page.layer.raster_dpi();
      if (std::fabs(page_scale - scale) > 0.01 * scale) {
        RELAYNORM_LOG_WARN("Page DPI disagrees with configured coordinate scale",
                           {StringField("file", content.document.file_name), IntField("page", page_index), DoubleField("configured", scale),
                            DoubleField("page", page_scale)});
      }
    }

    const auto image = raster::LoadPageRaster(page.raster_path);
    const auto marks = detector_.Detect(image, page.layer.runs(), scale);
    if (marks.empty()) {
      RELAYNORM_LOG_DEBUG("No checkboxes on page", {StringField("file", content.document.file_name), IntField("page", page_index)});
      continue;
    }

    auto page_results = Correlate(page, marks, notes);
    results.insert(results.end(), std::make_move_iterator(page_results.begin()), std::make_move_iterator(page_results.end()));
  }
  return results;
}

} // namespace relaynorm::strategy
