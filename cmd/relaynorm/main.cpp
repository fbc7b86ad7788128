#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/batch_runner.hpp"

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitFatal     = 2;
constexpr int kExitDocFailed = 3;

void PrintUsage() {
  std::cerr << "Usage: relaynorm <config.yaml> OR relaynorm --config <config.yaml>\n"
               "                 [--input <dir>] [--report <path>] [--dry-run]"
            << std::endl;
}

struct Options {
  std::string config_path;
  std::string input;
  std::string report;
  bool        dry_run = false;
};

bool ParseArgs(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool        has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      options.config_path = argv[++i];
    } else if (arg == "--input" && has_value) {
      options.input = argv[++i];
    } else if (arg == "--report" && has_value) {
      options.report = argv[++i];
    } else if (arg == "--dry-run") {
      options.dry_run = true;
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return false;
    }
  }
  return !options.config_path.empty();
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, options)) {
    PrintUsage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = relaynorm::config::ConfigLoader::LoadFromYaml(options.config_path);
    if (!options.input.empty()) config.mutable_batch()->set_input_directory(options.input);
    if (!options.report.empty()) config.mutable_batch()->set_report_path(options.report);
    if (options.dry_run) config.mutable_database()->Clear();

    relaynorm::observability::InitializeLogging(config);

    if (config.batch().input_directory().empty()) {
      RELAYNORM_LOG_ERROR("No input directory: set batch.input_directory or pass --input");
      relaynorm::observability::ShutdownLogging();
      return kExitUsage;
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = relaynorm::factory::Build(std::move(config));

    // ------------------------------------------------------------
    // Run batch
    // ------------------------------------------------------------
    relaynorm::pipeline::BatchRunner runner(app->config, *app->processor);
    const auto                       report = runner.Run();

    relaynorm::observability::ShutdownLogging();
    return report.documents_failed() > 0 ? kExitDocFailed : kExitOk;
  } catch (const std::exception& e) {
    RELAYNORM_LOG_ERROR("Fatal error", {relaynorm::observability::StringField("error", e.what())});
    relaynorm::observability::ShutdownLogging();
    return kExitFatal;
  }
}
