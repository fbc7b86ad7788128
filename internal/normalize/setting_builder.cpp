#include "setting_builder.hpp"

#include <map>
#include <set>

#include "internal/observability/logging.hpp"

namespace relaynorm::normalize {

using observability::IntField;
using observability::StringField;

SettingBuilder::SettingBuilder(const UnitNormalizer& normalizer, const MultipartGrouper& grouper)
    : normalizer_(normalizer), grouper_(grouper) {
}

std::vector<model::ActiveFlagResult> SettingBuilder::MergeFlags(const std::vector<model::ActiveFlagResult>& flags) {
  std::vector<model::ActiveFlagResult> merged;
  std::map<std::string, std::size_t>   index;

  for (const auto& flag : flags) {
    auto [it, inserted] = index.try_emplace(flag.function_code, merged.size());
    if (inserted) {
      merged.push_back(flag);
      continue;
    }
    auto& kept = merged[it->second];
    if (!kept.active && flag.active) kept = flag;
  }
  return merged;
}

DocumentSettings SettingBuilder::Build(const std::string&                          equipment_tag,
                                       const std::string&                          document_id,
                                       const std::vector<model::ParameterLine>&    lines,
                                       const std::vector<model::ActiveFlagResult>& flags) const {
  DocumentSettings out;

  const auto                                        merged = MergeFlags(flags);
  std::map<std::string, const model::ActiveFlagResult*> by_code;
  for (const auto& flag : merged) by_code.emplace(flag.function_code, &flag);

  std::set<std::string> seen;
  for (const auto& line : lines) {
    if (!seen.insert(line.code).second) {
      RELAYNORM_LOG_DEBUG("Duplicate parameter code ignored",
                          {StringField("document", document_id), StringField("code", line.code), IntField("page", line.page_index)});
      continue;
    }

    model::NormalizedSetting setting;
    setting.equipment_tag   = equipment_tag;
    setting.parameter_code  = line.code;
    setting.description     = line.description;
    setting.value           = normalizer_.NormalizeField(line.description, line.raw_value);
    setting.source_document = document_id;
    setting.page_index      = line.page_index;

    auto flag = by_code.find(line.code);
    if (flag != by_code.end()) {
      setting.is_active        = flag->second->active;
      setting.detection_method = flag->second->method;
    }
    out.settings.push_back(std::move(setting));
  }

  out.groups = grouper_.Group(out.settings);
  for (auto& group : out.groups) group.equipment_tag = equipment_tag;

  for (const auto& flag : merged) {
    if (flag.active) out.active_functions.push_back(flag);
  }
  return out;
}

} // namespace relaynorm::normalize
