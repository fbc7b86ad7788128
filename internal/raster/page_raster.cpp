#include "page_raster.hpp"

#include <system_error>

#include <opencv2/imgcodecs.hpp>

#include "internal/util/errors.hpp"

namespace relaynorm::raster {

cv::Mat LoadPageRaster(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw util::InvalidInput("cannot open raster: " + path.string());
  }

  cv::Mat image;
  try {
    image = cv::imread(path.string(), cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw util::InvalidInput("cannot decode raster " + path.string() + ": " + e.what());
  }
  if (image.empty()) {
    throw util::InvalidInput("unreadable or unsupported raster: " + path.string());
  }
  return image;
}

} // namespace relaynorm::raster
