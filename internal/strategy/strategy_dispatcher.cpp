#include "strategy_dispatcher.hpp"

#include "config/config.pb.h"
#include "internal/strategy/checkbox_strategy.hpp"
#include "internal/strategy/keyed_section_strategy.hpp"
#include "internal/strategy/labeled_field_strategy.hpp"
#include "internal/util/errors.hpp"

namespace relaynorm::strategy {

using relaynorm::runtime::config::RelayModelProfile;

std::unique_ptr<DetectionStrategy> MakeStrategy(const RelayModelProfile& profile) {
  switch (profile.strategy()) {
    case relaynorm::runtime::config::DETECTION_STRATEGY_CHECKBOX:
      return std::make_unique<CheckboxStrategy>(profile);
    case relaynorm::runtime::config::DETECTION_STRATEGY_LABELED_FIELD:
      return std::make_unique<LabeledFieldStrategy>(profile);
    case relaynorm::runtime::config::DETECTION_STRATEGY_KEYED_SECTION:
      return std::make_unique<KeyedSectionStrategy>(profile);
    default:
      throw util::InvalidConfig("profile '" + profile.name() + "' has no detection strategy");
  }
}

StrategyDispatcher::StrategyDispatcher(const std::vector<const RelayModelProfile*>& profiles) {
  for (const auto* profile : profiles) {
    auto [it, inserted] = strategies_.emplace(profile->name(), MakeStrategy(*profile));
    if (!inserted) {
      throw util::InvalidConfig("duplicate profile name '" + profile->name() + "'");
    }
  }
}

const DetectionStrategy& StrategyDispatcher::For(const std::string& profile_name) const {
  auto it = strategies_.find(profile_name);
  if (it == strategies_.end()) {
    throw util::UnknownModel("no detection strategy registered for profile '" + profile_name + "'");
  }
  return *it->second;
}

} // namespace relaynorm::strategy
