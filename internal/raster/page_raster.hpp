#pragma once

#include <filesystem>

#include <opencv2/core.hpp>

namespace relaynorm::raster {

/*
  Loads a rendered page as 8-bit BGR.

  Any format the OpenCV codecs read (PNG, JPEG, TIFF, BMP, PGM/PPM).
  Gray sources come back with three equal channels, 16-bit sources are
  scaled down and alpha is dropped.

  Throws util::InvalidInput when the file is missing or undecodable.
*/
cv::Mat LoadPageRaster(const std::filesystem::path& path);

} // namespace relaynorm::raster
