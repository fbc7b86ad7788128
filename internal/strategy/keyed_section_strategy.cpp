#include "keyed_section_strategy.hpp"

#include <algorithm>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::strategy {

using model::ActiveFlagResult;
using observability::StringField;

KeyedSectionStrategy::KeyedSectionStrategy(const relaynorm::runtime::config::RelayModelProfile& profile)
    : prefix_(util::FoldCase(profile.keyed_section().activation_key_prefix())),
      hint_section_(profile.keyed_section().equipment_hint_section()),
      hint_key_(profile.keyed_section().equipment_hint_key()) {
  for (const auto& value : profile.keyed_section().true_values()) {
    true_values_.push_back(util::FoldCase(util::Trim(value)));
  }
  for (const auto& definition : profile.functions()) {
    functions_.push_back({definition.code(), definition.description(), definition.section().empty() ? definition.code() : definition.section()});
  }
}

std::optional<int> KeyedSectionStrategy::ActivationIndex(const std::string& key) const {
  const auto folded = util::FoldCase(key);
  if (folded.size() <= prefix_.size() || folded.compare(0, prefix_.size(), prefix_) != 0) return std::nullopt;

  const auto digits = folded.substr(prefix_.size());
  if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) return std::nullopt;
  if (digits.size() > 6) return std::nullopt;
  return std::stoi(digits);
}

std::optional<int> KeyedSectionStrategy::ActiveGroup(const IniDocument::Section& section) const {
  std::optional<int> lowest;
  for (const auto& [key, value] : section.entries) {
    const auto index = ActivationIndex(key);
    if (!index) continue;
    const auto folded = util::FoldCase(value);
    if (std::find(true_values_.begin(), true_values_.end(), folded) == true_values_.end()) continue;
    if (!lowest || *index < *lowest) lowest = index;
  }
  return lowest;
}

std::vector<ActiveFlagResult> KeyedSectionStrategy::Detect(const DocumentContent& content, std::vector<ReviewNote>&) const {
  const auto doc = IniDocument::Parse(content.text);

  std::vector<ActiveFlagResult> results;

  if (!functions_.empty()) {
    for (const auto& function : functions_) {
      ActiveFlagResult result;
      result.function_code = function.code;
      result.description   = function.description.empty() ? function.section : function.description;
      result.method        = Method();

      if (const auto* section = doc.Find(function.section)) {
        result.group_index = ActiveGroup(*section);
        result.active      = result.group_index.has_value();
      } else {
        RELAYNORM_LOG_DEBUG("Function section absent; reading as inactive",
                            {StringField("file", content.document.file_name), StringField("section", function.section)});
      }
      results.push_back(std::move(result));
    }
    return results;
  }

  for (const auto& section : doc.Sections()) {
    const bool has_keys = std::any_of(section.entries.begin(), section.entries.end(), [&](const IniDocument::Entry& e) { return ActivationIndex(e.first).has_value(); });
    if (!has_keys) continue;

    ActiveFlagResult result;
    result.function_code = section.name;
    result.description   = section.name;
    result.method        = Method();
    result.group_index   = ActiveGroup(section);
    result.active        = result.group_index.has_value();
    results.push_back(std::move(result));
  }
  return results;
}

std::optional<std::vector<model::ParameterLine>> KeyedSectionStrategy::StructuredLines(const DocumentContent& content) const {
  const auto doc = IniDocument::Parse(content.text);

  std::vector<model::ParameterLine> lines;
  double                            row = 0.0;
  for (const auto& section : doc.Sections()) {
    for (const auto& [key, value] : section.entries) {
      row += 1.0;
      if (value.empty()) continue;

      model::ParameterLine line;
      line.code        = section.name.empty() ? key : section.name + "." + key;
      line.description = key;
      line.raw_value   = value;
      line.y           = row;
      lines.push_back(std::move(line));
    }
  }
  return lines;
}

std::optional<std::string> KeyedSectionStrategy::EquipmentHint(const DocumentContent& content) const {
  if (hint_key_.empty()) return std::nullopt;
  const auto doc = IniDocument::Parse(content.text);
  auto       value = doc.Value(hint_section_, hint_key_);
  if (value && util::Trim(*value).empty()) return std::nullopt;
  return value;
}

} // namespace relaynorm::strategy
