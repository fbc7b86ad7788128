#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/model/normalized_setting.hpp"

namespace relaynorm::runtime::config {
class MultipartPattern;
}

namespace relaynorm::normalize {

struct MultipartMarker {
  std::string                  base;
  std::uint32_t                observed_part = 0;
  std::optional<std::uint32_t> declared_total;
};

/*
  MultipartGrouper

  Recognizes descriptions such as "Tripping Matrix part 2" or
  "Opto Label (2/4)" and folds them into groups keyed by base text.

  Part indices inside a group are reassigned 1..N in order of the
  observed part number (reading order breaks ties), so a group is
  always contiguous and duplicate-free even when the source skips or
  repeats a number.
*/
class MultipartGrouper {
 public:
  explicit MultipartGrouper(const google::protobuf::RepeatedPtrField<relaynorm::runtime::config::MultipartPattern>& patterns);

  std::optional<MultipartMarker> Match(std::string_view description) const;

  // Marks members in place and returns one group per base.
  std::vector<model::MultipartGroup> Group(std::vector<model::NormalizedSetting>& settings) const;

 private:
  struct Pattern {
    std::regex    regex;
    std::uint32_t base_group  = 1;
    std::uint32_t part_group  = 2;
    std::uint32_t total_group = 0;
  };

  std::vector<Pattern> patterns_;
};

} // namespace relaynorm::normalize
