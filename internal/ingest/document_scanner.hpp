#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/source_document.hpp"

namespace relaynorm::runtime::config {
class RuntimeConfig;
}

namespace relaynorm::ingest {

/*
  DocumentScanner

  Lists the input directory and describes each file.

    *<bundle suffix>           page bundle
    configured text extension  plain text (.txt always counts)
    anything else              unknown

  Rasters referenced by a bundle belong to that bundle and are not
  listed on their own.

  Document ids are paths relative to batch.input_directory, so files
  sharing a name in different subdirectories stay distinct. Files
  outside that directory keep their full path.
*/
class DocumentScanner {
 public:
  explicit DocumentScanner(const relaynorm::runtime::config::RuntimeConfig& config);

  // regular files, sorted by path
  std::vector<std::filesystem::path> Scan(const std::filesystem::path& directory, bool recursive) const;

  model::DocumentKind Classify(const std::filesystem::path& path) const;

  // identity of a file whose bytes are already read
  model::SourceDocument Describe(const std::filesystem::path& path, std::string_view bytes) const;

  std::string DocumentId(const std::filesystem::path& path) const;

  static std::string ReadFile(const std::filesystem::path& path);

 private:
  // suffix that matched, or empty
  std::string BundleSuffix(const std::string& file_name) const;

  std::filesystem::path    root_;
  std::vector<std::string> bundle_suffixes_;
  std::set<std::string>    text_extensions_; // lower case
};

} // namespace relaynorm::ingest
