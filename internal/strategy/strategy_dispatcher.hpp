#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/strategy/detection_strategy.hpp"

namespace relaynorm::runtime::config {
class RelayModelProfile;
}

namespace relaynorm::strategy {

std::unique_ptr<DetectionStrategy> MakeStrategy(const relaynorm::runtime::config::RelayModelProfile& profile);

/*
  One strategy instance per profile, looked up by profile name.
  Built once at start-up and shared read-only by the batch workers.
*/
class StrategyDispatcher {
 public:
  explicit StrategyDispatcher(const std::vector<const relaynorm::runtime::config::RelayModelProfile*>& profiles);

  // throws util::UnknownModel for names not registered
  const DetectionStrategy& For(const std::string& profile_name) const;

  std::size_t Size() const {
    return strategies_.size();
  }

 private:
  std::map<std::string, std::unique_ptr<DetectionStrategy>> strategies_;
};

} // namespace relaynorm::strategy
