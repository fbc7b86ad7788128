#include "equipment_resolver.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::normalize {

using observability::StringField;

EquipmentResolver::EquipmentResolver(const google::protobuf::RepeatedPtrField<relaynorm::runtime::config::EquipmentPattern>& patterns) {
  for (const auto& pattern : patterns) {
    Pattern compiled;
    compiled.name = pattern.name();
    try {
      compiled.regex = std::regex(pattern.regex(), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      throw util::InvalidConfig("invalid equipment pattern '" + pattern.name() + "': " + e.what());
    }
    compiled.tag_format        = pattern.tag_format().empty() ? "{1}" : pattern.tag_format();
    compiled.substation_group  = pattern.substation_group();
    compiled.device_type_group = pattern.device_type_group();
    compiled.position_group    = pattern.position_group();
    patterns_.push_back(std::move(compiled));
  }
}

std::optional<model::EquipmentIdentity> EquipmentResolver::MatchPatterns(std::string_view text, const char* source) const {
  const std::string subject(text);
  std::smatch       match;

  for (const auto& pattern : patterns_) {
    if (!std::regex_search(subject, match, pattern.regex)) continue;

    std::vector<std::string> captures;
    captures.reserve(match.size());
    for (std::size_t i = 0; i < match.size(); ++i) {
      captures.push_back(match[i].str());
    }

    auto group = [&](std::uint32_t index) { return index > 0 && index < captures.size() ? captures[index] : std::string{}; };

    model::EquipmentIdentity identity;
    identity.tag         = util::FormatCaptures(pattern.tag_format, captures);
    identity.substation  = group(pattern.substation_group);
    identity.device_type = group(pattern.device_type_group);
    identity.position    = group(pattern.position_group);
    identity.source      = source;
    if (identity.tag.empty()) continue;

    RELAYNORM_LOG_DEBUG("Equipment pattern matched", {StringField("pattern", pattern.name), StringField("tag", identity.tag)});
    return identity;
  }
  return std::nullopt;
}

std::optional<model::EquipmentIdentity> EquipmentResolver::FromFileName(std::string_view file_name) const {
  return MatchPatterns(file_name, "filename");
}

std::optional<model::EquipmentIdentity> EquipmentResolver::Resolve(std::string_view file_name, const std::optional<std::string>& content_hint) const {
  if (content_hint) {
    const auto hint = util::Trim(*content_hint);
    if (!hint.empty()) {
      auto identity = MatchPatterns(hint, "content");
      if (!identity) {
        identity.emplace();
        identity->tag    = hint;
        identity->source = "content";
      }

      auto from_name = FromFileName(file_name);
      if (from_name && from_name->tag != identity->tag) {
        RELAYNORM_LOG_WARN("Content equipment hint overrides filename",
                           {StringField("file", file_name), StringField("filename_tag", from_name->tag), StringField("content_tag", identity->tag)});
      }
      return identity;
    }
  }
  return FromFileName(file_name);
}

} // namespace relaynorm::normalize
