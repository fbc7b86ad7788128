#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/parameter_line.hpp"
#include "relaynorm/v1/page_bundle.pb.h"

namespace relaynorm::runtime::config {
class ExtractorConfig;
}

namespace relaynorm::extract {

/*
  ParameterLineExtractor

  Turns a page's text layer into ordered ParameterLine records.

    1. column bands: x positions of code-bearing runs are clustered by
       column_gap; every run joins the band whose start is the greatest
       one not to its right
    2. visual lines: inside a band, runs within line_merge_tolerance on
       y are one line, ordered by x
    3. a line led by a code token starts a record; the rest splits at
       the first ':' into description and value, or takes its last
       cell as value
    4. a line with no code continues the previous record's description

  A page without any code yields an empty list.
*/
class ParameterLineExtractor {
 public:
  explicit ParameterLineExtractor(const relaynorm::runtime::config::ExtractorConfig& config);

  std::vector<model::ParameterLine> Extract(const relaynorm::v1::PageLayer& page) const;

  // token with an optional trailing ':'
  bool IsCode(std::string_view token) const;

 private:
  struct Run {
    std::string text;
    double      x = 0.0;
    double      y = 0.0; // vertical centre
  };

  std::vector<double> ColumnStarts(const std::vector<Run>& runs) const;

  std::vector<std::regex>  code_patterns_;
  std::vector<std::string> blacklist_;
  double                   column_gap_           = 150.0;
  double                   line_merge_tolerance_ = 3.0;
};

} // namespace relaynorm::extract
