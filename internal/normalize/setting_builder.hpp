#pragma once

#include <string>
#include <vector>

#include "internal/model/active_flag.hpp"
#include "internal/model/normalized_setting.hpp"
#include "internal/model/parameter_line.hpp"
#include "internal/normalize/multipart_grouper.hpp"
#include "internal/normalize/unit_normalizer.hpp"

namespace relaynorm::normalize {

// What one document contributes to the store.
struct DocumentSettings {
  std::vector<model::NormalizedSetting> settings;
  std::vector<model::MultipartGroup>    groups;

  // active functions only, one per function code
  std::vector<model::ActiveFlagResult> active_functions;
};

/*
  SettingBuilder

  Joins extracted parameter lines with detection results:

    - one setting per distinct parameter code, first occurrence wins
    - value atomized by the profile's normalizer
    - is_active set when an active result carries the same code
    - multipart members numbered and grouped
*/
class SettingBuilder {
 public:
  SettingBuilder(const UnitNormalizer& normalizer, const MultipartGrouper& grouper);

  DocumentSettings Build(const std::string&                          equipment_tag,
                         const std::string&                          document_id,
                         const std::vector<model::ParameterLine>&    lines,
                         const std::vector<model::ActiveFlagResult>& flags) const;

  // Collapses results to one per code; active wins over inactive.
  static std::vector<model::ActiveFlagResult> MergeFlags(const std::vector<model::ActiveFlagResult>& flags);

 private:
  const UnitNormalizer&   normalizer_;
  const MultipartGrouper& grouper_;
};

} // namespace relaynorm::normalize
