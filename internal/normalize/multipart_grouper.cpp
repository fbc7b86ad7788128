#include "multipart_grouper.hpp"

#include <algorithm>
#include <map>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::normalize {

using observability::IntField;
using observability::StringField;

namespace {

// part numbers wider than this are not part markers
constexpr std::size_t kMaxPartDigits = 9;

std::optional<std::uint32_t> ParsePartNumber(const std::string& digits) {
  if (digits.empty() || digits.size() > kMaxPartDigits) return std::nullopt;
  if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) return std::nullopt;
  return static_cast<std::uint32_t>(std::stoul(digits));
}

} // namespace

MultipartGrouper::MultipartGrouper(const google::protobuf::RepeatedPtrField<relaynorm::runtime::config::MultipartPattern>& patterns) {
  for (const auto& pattern : patterns) {
    try {
      patterns_.push_back({std::regex(pattern.regex(), std::regex::ECMAScript), pattern.base_group(), pattern.part_group(), pattern.total_group()});
    } catch (const std::regex_error& e) {
      throw util::InvalidConfig("invalid multipart pattern '" + pattern.regex() + "': " + e.what());
    }
  }
}

std::optional<MultipartMarker> MultipartGrouper::Match(std::string_view description) const {
  const std::string text = util::Trim(description);
  std::smatch       match;
  for (const auto& pattern : patterns_) {
    if (!std::regex_match(text, match, pattern.regex)) continue;
    if (pattern.base_group >= match.size() || pattern.part_group >= match.size()) continue;

    MultipartMarker marker;
    marker.base = util::Trim(match[pattern.base_group].str());
    const auto part = ParsePartNumber(match[pattern.part_group].str());
    if (marker.base.empty() || !part) continue;
    marker.observed_part = *part;

    if (pattern.total_group > 0 && pattern.total_group < match.size() && match[pattern.total_group].matched) {
      const auto total = ParsePartNumber(match[pattern.total_group].str());
      if (!total) continue;
      marker.declared_total = *total;
    }
    return marker;
  }
  return std::nullopt;
}

std::vector<model::MultipartGroup> MultipartGrouper::Group(std::vector<model::NormalizedSetting>& settings) const {
  struct Member {
    std::size_t   index;
    std::uint32_t observed;
  };
  struct Pending {
    std::vector<Member>          members;
    std::optional<std::uint32_t> declared_total;
  };

  std::vector<std::string>       order;
  std::map<std::string, Pending> pending;

  for (std::size_t i = 0; i < settings.size(); ++i) {
    auto marker = Match(settings[i].description);
    if (!marker) continue;

    auto [it, inserted] = pending.try_emplace(marker->base);
    if (inserted) order.push_back(marker->base);
    it->second.members.push_back({i, marker->observed_part});
    if (marker->declared_total) {
      it->second.declared_total = std::max(it->second.declared_total.value_or(0), *marker->declared_total);
    }
  }

  std::vector<model::MultipartGroup> groups;
  groups.reserve(order.size());

  for (const auto& base : order) {
    auto& group = pending[base];
    std::stable_sort(group.members.begin(), group.members.end(), [](const Member& a, const Member& b) { return a.observed < b.observed; });

    bool renumbered = false;
    for (std::size_t k = 0; k < group.members.size(); ++k) {
      const auto assigned = static_cast<std::uint32_t>(k + 1);
      auto&      setting  = settings[group.members[k].index];
      setting.is_multipart   = true;
      setting.multipart_base = base;
      setting.multipart_part = assigned;
      renumbered |= group.members[k].observed != assigned;
    }

    const auto part_count = static_cast<std::uint32_t>(group.members.size());
    if (renumbered) {
      RELAYNORM_LOG_WARN("Multipart parts renumbered to a contiguous sequence",
                         {StringField("base", base), IntField("parts", part_count)});
    }
    if (group.declared_total && *group.declared_total != part_count) {
      RELAYNORM_LOG_WARN("Multipart group size differs from declared total",
                         {StringField("base", base), IntField("parts", part_count), IntField("declared", *group.declared_total)});
    }

    model::MultipartGroup out;
    out.equipment_tag  = group.members.empty() ? std::string{} : settings[group.members.front().index].equipment_tag;
    out.base           = base;
    out.part_count     = part_count;
    out.declared_total = group.declared_total;
    groups.push_back(std::move(out));
  }

  return groups;
}

} // namespace relaynorm::normalize
