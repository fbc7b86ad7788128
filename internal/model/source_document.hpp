#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace relaynorm::model {

enum class DocumentKind {
  kUnknown,
  kPageBundle,
  kPlainText,
};

/*
  One input file as discovered by the scanner. Immutable after ingestion.
*/
struct SourceDocument {
  std::filesystem::path path;

  // path relative to the input directory, '/' separated; keys every
  // row written for this file
  std::string document_id;

  // file name used for model and equipment resolution; for page
  // bundles this is the name of the rendered source PDF
  std::string   file_name;
  std::string   extension; // lower case, with leading dot
  std::uint64_t size_bytes = 0;
  std::string   digest;
  DocumentKind  kind = DocumentKind::kUnknown;
};

} // namespace relaynorm::model
