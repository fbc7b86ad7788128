#include "page_bundle_loader.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::extract {

namespace {

// nominal 10pt monospace grid
constexpr double kRowPitch  = 12.0;
constexpr double kCharWidth = 6.0;

} // namespace

relaynorm::v1::PageBundle PageBundleLoader::Load(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InvalidInput("cannot open page bundle: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str(), path.string());
}

relaynorm::v1::PageBundle PageBundleLoader::Parse(std::string_view json, const std::string& origin) {
  relaynorm::v1::PageBundle bundle;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &bundle, options);
  if (!status.ok()) {
    throw util::InvalidInput("malformed page bundle " + origin + ": " + std::string(status.message()));
  }
  return bundle;
}

std::filesystem::path PageBundleLoader::ResolveRaster(const std::filesystem::path& bundle_path, const relaynorm::v1::PageLayer& page) {
  std::filesystem::path raster(page.raster_path());
  if (raster.empty() || raster.is_absolute()) return raster;
  return bundle_path.parent_path() / raster;
}

relaynorm::v1::PageLayer TextToPage(std::string_view text, std::uint32_t page_index) {
  relaynorm::v1::PageLayer page;
  page.set_index(page_index);

  const auto lines = util::SplitLines(text);
  for (std::size_t row = 0; row < lines.size(); ++row) {
    const auto& line = lines[row];

    std::size_t i = 0;
    while (i < line.size()) {
      while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
      if (i >= line.size()) break;

      const std::size_t start = i;
      std::size_t       end   = i;
      while (i < line.size()) {
        if (line[i] == '\t') break;
        if (line[i] == ' ' && i + 1 < line.size() && line[i + 1] == ' ') break;
        ++i;
        end = i;
      }

      auto cell = util::Trim(std::string_view(line).substr(start, end - start));
      if (cell.empty()) continue;

      auto* run = page.add_runs();
      run->set_text(cell);
      run->set_x(static_cast<double>(start) * kCharWidth);
      run->set_y(static_cast<double>(row) * kRowPitch);
      run->set_width(static_cast<double>(end - start) * kCharWidth);
      run->set_height(kRowPitch);
    }
  }
  return page;
}

std::string LayerText(const relaynorm::v1::PageLayer& page) {
  std::vector<const relaynorm::v1::TextRun*> runs;
  runs.reserve(page.runs_size());
  for (const auto& run : page.runs()) runs.push_back(&run);

  auto centre = [](const relaynorm::v1::TextRun* r) { return r->y() + r->height() / 2.0; };
  std::stable_sort(runs.begin(), runs.end(), [&](const auto* a, const auto* b) {
    if (centre(a) != centre(b)) return centre(a) < centre(b);
    return a->x() < b->x();
  });

  // a run joins the current line when its centre is within half a
  // line height of the line's first run
  std::vector<std::vector<const relaynorm::v1::TextRun*>> lines;
  double line_centre = 0.0;
  double line_slack  = 0.0;
  for (const auto* run : runs) {
    if (lines.empty() || std::fabs(centre(run) - line_centre) > line_slack) {
      lines.emplace_back();
      line_centre = centre(run);
      line_slack  = std::max(1.0, run->height() / 2.0);
    }
    lines.back().push_back(run);
  }

  std::string out;
  for (auto& line : lines) {
    std::stable_sort(line.begin(), line.end(), [](const auto* a, const auto* b) { return a->x() < b->x(); });
    for (std::size_t i = 0; i < line.size(); ++i) {
      if (i > 0) out += "  ";
      out += line[i]->text();
    }
    out += '\n';
  }
  return out;
}

std::string BundleText(const relaynorm::v1::PageBundle& bundle) {
  std::string out;
  for (const auto& page : bundle.pages()) {
    if (!out.empty()) out += '\n';
    out += LayerText(page);
  }
  return out;
}

} // namespace relaynorm::extract
