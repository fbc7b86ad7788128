#include "labeled_field_strategy.hpp"

#include <algorithm>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::strategy {

using model::ActiveFlagResult;
using observability::StringField;

namespace {

std::vector<std::string> Folded(const google::protobuf::RepeatedPtrField<std::string>& values) {
  std::vector<std::string> out;
  for (const auto& value : values) out.push_back(util::FoldCase(util::Trim(value)));
  return out;
}

bool Contains(const std::vector<std::string>& haystack, const std::string& needle) {
  return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
}

} // namespace

LabeledFieldStrategy::LabeledFieldStrategy(const relaynorm::runtime::config::RelayModelProfile& profile)
    : disabled_markers_(Folded(profile.labeled_field().disabled_markers())),
      enabled_markers_(Folded(profile.labeled_field().enabled_markers())),
      unknown_is_active_(profile.labeled_field().unknown_marker_is_active()) {
  for (const auto& definition : profile.functions()) {
    Function function;
    function.code        = definition.code();
    function.description = definition.description();
    function.labels      = Folded(definition.labels());
    if (function.description.empty() && !definition.labels().empty()) function.description = definition.labels(0);
    functions_.push_back(std::move(function));
  }
}

bool LabeledFieldStrategy::MarkerIsActive(const std::string& marker) const {
  const auto folded = util::FoldCase(util::Trim(marker));
  if (folded.empty()) return false;
  if (Contains(disabled_markers_, folded)) return false;
  if (Contains(enabled_markers_, folded)) return true;
  return unknown_is_active_;
}

bool LabeledFieldStrategy::StartsWithAnyLabel(const std::string& folded_line) const {
  for (const auto& function : functions_) {
    for (const auto& label : function.labels) {
      if (!label.empty() && folded_line.compare(0, label.size(), label) == 0) return true;
    }
  }
  return false;
}

std::optional<std::string> LabeledFieldStrategy::FindMarker(const std::vector<std::string>& lines, const std::string& folded_label) const {
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto folded = util::FoldCase(lines[i]);
    if (folded_label.empty() || folded.compare(0, folded_label.size(), folded_label) != 0) continue;

    auto rest = util::Trim(std::string_view(lines[i]).substr(folded_label.size()));
    if (!rest.empty() && rest.front() == ':') rest = util::Trim(std::string_view(rest).substr(1));
    if (!rest.empty()) return rest;

    for (std::size_t j = i + 1; j < lines.size(); ++j) {
      if (lines[j].empty()) continue;
      // the next label, not a marker
      if (StartsWithAnyLabel(util::FoldCase(lines[j]))) return std::string{};
      return lines[j];
    }
    return std::string{};
  }
  return std::nullopt;
}

std::vector<ActiveFlagResult> LabeledFieldStrategy::Detect(const DocumentContent& content, std::vector<ReviewNote>&) const {
  std::vector<std::string> lines;
  for (const auto& line : util::SplitLines(content.text)) lines.push_back(util::Trim(line));

  std::vector<ActiveFlagResult> results;
  results.reserve(functions_.size());

  for (const auto& function : functions_) {
    ActiveFlagResult result;
    result.function_code = function.code;
    result.description   = function.description;
    result.method        = Method();

    bool seen = false;
    for (std::size_t k = 0; k < function.labels.size(); ++k) {
      auto marker = FindMarker(lines, function.labels[k]);
      if (!marker) continue;
      seen = true;
      if (MarkerIsActive(*marker)) {
        result.active      = true;
        result.group_index = static_cast<int>(k);
        break;
      }
    }

    if (!seen) {
      RELAYNORM_LOG_DEBUG("Function label absent; reading as inactive", {StringField("file", content.document.file_name), StringField("function", function.code)});
    }
    results.push_back(std::move(result));
  }
  return results;
}

} // namespace relaynorm::strategy
