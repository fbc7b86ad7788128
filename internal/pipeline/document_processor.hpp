#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/profile_registry.hpp"
#include "internal/ingest/document_scanner.hpp"
#include "internal/normalize/equipment_resolver.hpp"
#include "internal/normalize/multipart_grouper.hpp"
#include "internal/persist/setting_writer.hpp"
#include "internal/strategy/model_resolver.hpp"
#include "internal/strategy/strategy_dispatcher.hpp"
#include "internal/text/text_decoder.hpp"
#include "relaynorm/v1/report.pb.h"

namespace relaynorm::pipeline {

struct ProcessResult {
  relaynorm::v1::DocumentOutcome         outcome;
  std::vector<relaynorm::v1::ReviewItem> review_items;
};

/*
  DocumentProcessor

  Runs one document end to end:

    read -> decode -> resolve model -> extract lines -> detect
         -> resolve equipment -> build settings -> persist

  Never throws for a document problem: every failure becomes an
  outcome (skipped or failed) with at least one review item. All
  members are read-only after construction, so one instance serves
  every worker.
*/
class DocumentProcessor {
 public:
  DocumentProcessor(const relaynorm::runtime::config::RuntimeConfig& config,
                    const config::ProfileRegistry&                  registry,
                    const strategy::StrategyDispatcher&             strategies,
                    std::shared_ptr<db::Repository>                 repository);

  ProcessResult Process(const std::filesystem::path& path) const;

 private:
  void Run(const std::filesystem::path& path, ProcessResult& result) const;

  strategy::DocumentContent LoadBundle(const model::SourceDocument& document, const std::string& bytes) const;
  strategy::DocumentContent LoadText(const model::SourceDocument& document, const std::string& bytes) const;

  // false when the document must be skipped
  bool CheckCalibration(const config::ProfileEntry& entry, ProcessResult& result) const;

  const relaynorm::runtime::config::RuntimeConfig& config_;
  const config::ProfileRegistry&                  registry_;
  const strategy::StrategyDispatcher&             strategies_;

  ingest::DocumentScanner      scanner_;
  strategy::ModelResolver      models_;
  text::TextDecoder            decoder_;
  normalize::EquipmentResolver equipment_;
  normalize::MultipartGrouper  grouper_;
  persist::SettingWriter       writer_;
};

} // namespace relaynorm::pipeline
