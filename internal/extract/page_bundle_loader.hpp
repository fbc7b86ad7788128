#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "relaynorm/v1/page_bundle.pb.h"

namespace relaynorm::extract {

/*
  Reads the renderer's page bundle (*.pages.json).

  The bundle is the JSON mapping of relaynorm.v1.PageBundle; unknown
  fields are rejected so a renderer version drift fails loudly.
*/
class PageBundleLoader {
 public:
  static relaynorm::v1::PageBundle Load(const std::filesystem::path& path);

  static relaynorm::v1::PageBundle Parse(std::string_view json, const std::string& origin);

  // raster_path is relative to the bundle's directory unless absolute
  static std::filesystem::path ResolveRaster(const std::filesystem::path& bundle_path, const relaynorm::v1::PageLayer& page);
};

/*
  Lays plain text out as a single page on a monospace grid: one row
  per line, cells split on tabs or runs of two or more spaces.
*/
relaynorm::v1::PageLayer TextToPage(std::string_view text, std::uint32_t page_index = 0);

// Text layer in reading order: one line per visual row, cells joined
// by two spaces so TextToPage() splits them again.
std::string LayerText(const relaynorm::v1::PageLayer& page);

// all pages in order, one reading-order block per page
std::string BundleText(const relaynorm::v1::PageBundle& bundle);

} // namespace relaynorm::extract
