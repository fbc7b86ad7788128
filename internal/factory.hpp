#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/profile_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/document_processor.hpp"
#include "internal/strategy/strategy_dispatcher.hpp"

namespace relaynorm::factory {

/*
  Application

  Owns every long-lived object of a batch run. The registry and the
  processor point into config, so Application is built in place and
  never moved.
*/
struct Application {
  explicit Application(relaynorm::runtime::config::RuntimeConfig runtime_config);

  Application(const Application&)            = delete;
  Application& operator=(const Application&) = delete;

  relaynorm::runtime::config::RuntimeConfig config;

  std::unique_ptr<config::ProfileRegistry>       registry;
  std::unique_ptr<strategy::StrategyDispatcher>  strategies;
  std::shared_ptr<db::Repository>                repository;
  std::unique_ptr<pipeline::DocumentProcessor>   processor;
};

/*
  BuildRepository

  The composition root for storage: the ONLY place that knows concrete
  DB types. Neither backend configured selects the in-memory one.
  SQL backends have their schema migrated before they are returned.
*/
std::shared_ptr<db::Repository> BuildRepository(const relaynorm::runtime::config::DatabaseConfig& database);

std::unique_ptr<Application> Build(relaynorm::runtime::config::RuntimeConfig config);

} // namespace relaynorm::factory
