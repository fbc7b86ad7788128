#include "checkbox_detector.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relaynorm::detect {

using model::CheckboxMark;
using model::PixelBox;
using observability::DoubleField;
using observability::IntField;

namespace {

cv::Rect ToRect(const PixelBox& box) {
  return {box.x, box.y, box.width, box.height};
}

// fraction of one border inked, over a two pixel deep strip
double SideCoverage(const cv::Mat& mask, const cv::Rect& strip, int reduce_dim) {
  cv::Mat line;
  cv::reduce(mask(strip), line, reduce_dim, cv::REDUCE_MAX);
  return static_cast<double>(cv::countNonZero(line)) / static_cast<double>(line.total());
}

bool BordersInked(const cv::Mat& mask, const cv::Rect& box, double min_coverage) {
  if (box.width < 2 || box.height < 2) return false;
  const cv::Rect top(box.x, box.y, box.width, 2);
  const cv::Rect bottom(box.x, box.y + box.height - 2, box.width, 2);
  const cv::Rect left(box.x, box.y, 2, box.height);
  const cv::Rect right(box.x + box.width - 2, box.y, 2, box.height);
  return SideCoverage(mask, top, 0) >= min_coverage && SideCoverage(mask, bottom, 0) >= min_coverage &&
         SideCoverage(mask, left, 1) >= min_coverage && SideCoverage(mask, right, 1) >= min_coverage;
}

double MeanInkSaturation(const cv::Mat& saturation, const cv::Mat& mask, const cv::Rect& box) {
  if (saturation.empty() || cv::countNonZero(mask(box)) == 0) return 0.0;
  return cv::mean(saturation(box), mask(box))[0];
}

double InteriorDensity(const cv::Mat& mask, const cv::Rect& box, int inset) {
  const cv::Rect interior(box.x + inset, box.y + inset, box.width - 2 * inset, box.height - 2 * inset);
  if (interior.width <= 0 || interior.height <= 0) return 0.0;
  return static_cast<double>(cv::countNonZero(mask(interior))) / static_cast<double>(interior.area());
}

double Quantile(std::vector<double> sorted, double q) {
  const double pos = q * static_cast<double>(sorted.size() - 1);
  const auto   lo  = static_cast<std::size_t>(std::floor(pos));
  const auto   hi  = static_cast<std::size_t>(std::ceil(pos));
  return sorted[lo] + (sorted[hi] - sorted[lo]) * (pos - static_cast<double>(lo));
}

} // namespace

CheckboxSettings CheckboxSettings::FromConfig(const relaynorm::runtime::config::CheckboxConfig& config) {
  CheckboxSettings settings;
  settings.density_threshold      = config.density_threshold();
  settings.min_size_px            = static_cast<int>(config.min_size_px());
  settings.max_size_px            = static_cast<int>(config.max_size_px());
  settings.max_aspect_deviation   = config.max_aspect_deviation();
  settings.interior_inset_px      = static_cast<int>(config.interior_inset_px());
  settings.binarize_threshold     = static_cast<int>(config.binarize_threshold());
  settings.min_border_coverage    = config.min_border_coverage();
  settings.max_saturation         = config.max_saturation();
  settings.text_mask_margin_px    = static_cast<int>(config.text_mask_margin_px());
  settings.auto_threshold         = config.auto_threshold();
  settings.auto_min_iqr           = config.auto_min_iqr();
  settings.auto_iqr_fraction      = config.auto_iqr_fraction();
  settings.auto_threshold_floor   = config.auto_threshold_floor();
  settings.auto_threshold_ceiling = config.auto_threshold_ceiling();
  return settings;
}

CheckboxDetector::CheckboxDetector(CheckboxSettings settings) : settings_(std::move(settings)) {
}

std::vector<CheckboxMark> CheckboxDetector::Detect(const cv::Mat&                                                    page,
                                                   const google::protobuf::RepeatedPtrField<relaynorm::v1::TextRun>& runs,
                                                   double text_units_per_pixel) const {
  if (page.empty()) return {};
  if (page.depth() != CV_8U || (page.channels() != 1 && page.channels() != 3)) {
    throw util::InvalidInput("checkbox detection needs an 8-bit gray or BGR page");
  }

  cv::Mat gray;
  cv::Mat saturation;
  if (page.channels() == 3) {
    cv::cvtColor(page, gray, cv::COLOR_BGR2GRAY);
    cv::Mat hsv;
    cv::cvtColor(page, hsv, cv::COLOR_BGR2HSV);
    cv::extractChannel(hsv, saturation, 1);
  } else {
    gray = page;
  }

  // ink is 255: gray < binarize_threshold
  cv::Mat mask;
  cv::threshold(gray, mask, settings_.binarize_threshold - 1, 255, cv::THRESH_BINARY_INV);

  // ---- mask text glyphs ----
  const double scale  = text_units_per_pixel > 0.0 ? text_units_per_pixel : 1.0;
  const int    margin = settings_.text_mask_margin_px;
  for (const auto& run : runs) {
    const cv::Point top_left(static_cast<int>(std::floor(run.x() / scale)) - margin, static_cast<int>(std::floor(run.y() / scale)) - margin);
    const cv::Point bottom_right(static_cast<int>(std::ceil((run.x() + run.width()) / scale)) + margin,
                                 static_cast<int>(std::ceil((run.y() + run.height()) / scale)) + margin);
    cv::rectangle(mask, top_left, bottom_right, cv::Scalar(0), cv::FILLED);
  }

  // ---- candidate shapes ----
  cv::Mat   labels;
  cv::Mat   stats;
  cv::Mat   centroids;
  const int count = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

  std::vector<CheckboxMark> candidates;
  for (int label = 1; label < count; ++label) {
    const PixelBox box{stats.at<int>(label, cv::CC_STAT_LEFT), stats.at<int>(label, cv::CC_STAT_TOP), stats.at<int>(label, cv::CC_STAT_WIDTH),
                       stats.at<int>(label, cv::CC_STAT_HEIGHT)};
    if (box.width < settings_.min_size_px || box.height < settings_.min_size_px) continue;
    if (box.width > settings_.max_size_px || box.height > settings_.max_size_px) continue;

    const double aspect = static_cast<double>(box.width) / static_cast<double>(box.height);
    if (std::fabs(aspect - 1.0) > settings_.max_aspect_deviation) continue;

    const cv::Rect rect = ToRect(box);
    if (!BordersInked(mask, rect, settings_.min_border_coverage)) continue;

    CheckboxMark mark;
    mark.box        = box;
    mark.center_x   = box.x + box.width / 2.0;
    mark.center_y   = box.y + box.height / 2.0;
    mark.saturation = MeanInkSaturation(saturation, mask, rect);
    if (mark.saturation > settings_.max_saturation) {
      RELAYNORM_LOG_DEBUG("Coloured shape rejected", {IntField("x", box.x), IntField("y", box.y), DoubleField("saturation", mark.saturation)});
      continue;
    }
    mark.density = InteriorDensity(mask, rect, settings_.interior_inset_px);
    candidates.push_back(mark);
  }

  // ---- collapse overlaps, larger box wins ----
  std::stable_sort(candidates.begin(), candidates.end(), [](const CheckboxMark& a, const CheckboxMark& b) { return a.box.Area() > b.box.Area(); });

  std::vector<CheckboxMark> kept;
  for (const auto& candidate : candidates) {
    const bool overlaps = std::any_of(kept.begin(), kept.end(), [&](const CheckboxMark& k) {
      const int shared = (ToRect(k.box) & ToRect(candidate.box)).area();
      return shared * 2 > candidate.box.Area();
    });
    if (!overlaps) kept.push_back(candidate);
  }

  // ---- classify ----
  std::vector<double> densities;
  densities.reserve(kept.size());
  for (const auto& mark : kept) densities.push_back(mark.density);
  const double threshold = EffectiveThreshold(densities);
  for (auto& mark : kept) {
    mark.marked = mark.density > threshold;
  }

  std::sort(kept.begin(), kept.end(), [](const CheckboxMark& a, const CheckboxMark& b) {
    return a.center_y < b.center_y || (a.center_y == b.center_y && a.center_x < b.center_x);
  });
  return kept;
}

double CheckboxDetector::EffectiveThreshold(const std::vector<double>& densities) const {
  if (!settings_.auto_threshold || densities.size() < 4) {
    return settings_.density_threshold;
  }

  std::vector<double> sorted = densities;
  std::sort(sorted.begin(), sorted.end());
  const double q1  = Quantile(sorted, 0.25);
  const double q3  = Quantile(sorted, 0.75);
  const double iqr = q3 - q1;
  if (iqr <= settings_.auto_min_iqr) {
    return settings_.density_threshold;
  }

  const double median    = Quantile(sorted, 0.5);
  const double threshold = std::clamp(median + settings_.auto_iqr_fraction * iqr, settings_.auto_threshold_floor, settings_.auto_threshold_ceiling);
  RELAYNORM_LOG_DEBUG("Adaptive density threshold", {DoubleField("threshold", threshold), DoubleField("iqr", iqr)});
  return threshold;
}

} // namespace relaynorm::detect
