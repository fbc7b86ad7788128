#include "parameter_line_extractor.hpp"

#include <algorithm>
#include <cmath>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::extract {

namespace {

std::string LeadingToken(std::string_view text) {
  const auto end = text.find_first_of(" \t");
  return std::string(text.substr(0, end));
}

std::string StripColon(std::string token) {
  while (!token.empty() && token.back() == ':') token.pop_back();
  return token;
}

void AppendText(std::string& target, std::string_view text) {
  if (text.empty()) return;
  if (!target.empty()) target.push_back(' ');
  target.append(text);
}

} // namespace

ParameterLineExtractor::ParameterLineExtractor(const relaynorm::runtime::config::ExtractorConfig& config)
    : column_gap_(config.column_gap() > 0.0 ? config.column_gap() : 150.0),
      line_merge_tolerance_(config.line_merge_tolerance() > 0.0 ? config.line_merge_tolerance() : 3.0) {
  for (const auto& pattern : config.code_patterns()) {
    try {
      code_patterns_.emplace_back(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      throw util::InvalidConfig("invalid code pattern '" + pattern + "': " + e.what());
    }
  }
  for (const auto& code : config.code_blacklist()) {
    blacklist_.push_back(StripColon(code));
  }
}

bool ParameterLineExtractor::IsCode(std::string_view token) const {
  if (token.empty()) return false;
  const std::string text(token);
  const auto        bare = StripColon(text);
  if (bare.empty()) return false;
  if (std::find(blacklist_.begin(), blacklist_.end(), bare) != blacklist_.end()) return false;
  return std::any_of(code_patterns_.begin(), code_patterns_.end(), [&](const std::regex& re) { return std::regex_match(text, re); });
}

std::vector<double> ParameterLineExtractor::ColumnStarts(const std::vector<Run>& runs) const {
  // A bare code-like cell ("1000") with text just left of it on the
  // same row is a value, not the head of a column. Cells that read
  // "0160:" or "010D Frequency" always head a column.
  auto has_left_neighbour = [&](const Run& cell) {
    return std::any_of(runs.begin(), runs.end(), [&](const Run& other) {
      return &other != &cell && std::fabs(other.y - cell.y) <= line_merge_tolerance_ && other.x < cell.x && cell.x - other.x <= column_gap_;
    });
  };

  std::vector<double> xs;
  for (const auto& run : runs) {
    const auto token = LeadingToken(run.text);
    if (!IsCode(token)) continue;
    const bool explicit_code = token.back() == ':' || token.size() < run.text.size();
    if (explicit_code || !has_left_neighbour(run)) xs.push_back(run.x);
  }
  std::sort(xs.begin(), xs.end());

  std::vector<double> starts;
  double              previous = 0.0;
  for (double x : xs) {
    if (starts.empty() || x - previous > column_gap_) {
      starts.push_back(x);
    }
    previous = x;
  }
  return starts;
}

std::vector<model::ParameterLine> ParameterLineExtractor::Extract(const relaynorm::v1::PageLayer& page) const {
  std::vector<Run> runs;
  runs.reserve(static_cast<std::size_t>(page.runs_size()));
  for (const auto& run : page.runs()) {
    auto text = util::Trim(run.text());
    if (text.empty()) continue;
    runs.push_back({std::move(text), run.x(), run.y() + run.height() / 2.0});
  }

  const auto starts = ColumnStarts(runs);
  if (starts.empty()) return {};

  // ---- bands ----
  std::vector<std::vector<Run>> bands(starts.size());
  for (auto& run : runs) {
    std::size_t band = 0;
    for (std::size_t b = 0; b < starts.size(); ++b) {
      if (starts[b] <= run.x + line_merge_tolerance_) band = b;
    }
    bands[band].push_back(std::move(run));
  }

  std::vector<model::ParameterLine> out;

  for (std::size_t b = 0; b < bands.size(); ++b) {
    auto& band = bands[b];
    std::stable_sort(band.begin(), band.end(), [](const Run& l, const Run& r) { return l.y < r.y || (l.y == r.y && l.x < r.x); });

    // ---- visual lines ----
    std::vector<std::vector<Run>> lines;
    double                        line_y = 0.0;
    for (auto& run : band) {
      if (lines.empty() || std::fabs(run.y - line_y) > line_merge_tolerance_) {
        lines.emplace_back();
        line_y = run.y;
      }
      lines.back().push_back(std::move(run));
    }

    bool have_record = false;
    for (auto& line : lines) {
      std::stable_sort(line.begin(), line.end(), [](const Run& l, const Run& r) { return l.x < r.x; });

      const auto token = LeadingToken(line.front().text);
      if (!IsCode(token)) {
        if (!have_record) continue;
        std::vector<std::string> texts;
        for (const auto& run : line) texts.push_back(run.text);
        AppendText(out.back().description, util::Join(texts, " "));
        continue;
      }

      model::ParameterLine record;
      record.code       = StripColon(token);
      record.x          = line.front().x;
      record.y          = line.front().y;
      record.column     = static_cast<std::uint32_t>(b);
      record.page_index = page.index();

      std::vector<std::string> cells;
      auto first_rest = util::Trim(std::string_view(line.front().text).substr(token.size()));
      if (!first_rest.empty() && first_rest.front() == ':') first_rest = util::Trim(std::string_view(first_rest).substr(1));
      if (!first_rest.empty()) cells.push_back(std::move(first_rest));
      for (std::size_t i = 1; i < line.size(); ++i) cells.push_back(line[i].text);

      const auto joined = util::Join(cells, " ");
      const auto colon  = joined.find(':');
      if (colon != std::string::npos) {
        record.description = util::Trim(std::string_view(joined).substr(0, colon));
        record.raw_value   = util::Trim(std::string_view(joined).substr(colon + 1));
      } else if (cells.size() >= 2) {
        record.raw_value = cells.back();
        cells.pop_back();
        record.description = util::Join(cells, " ");
      } else {
        record.description = joined;
      }

      out.push_back(std::move(record));
      have_record = true;
    }
  }

  return out;
}

} // namespace relaynorm::extract
