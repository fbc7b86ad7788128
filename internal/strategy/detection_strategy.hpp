#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/active_flag.hpp"
#include "internal/model/parameter_line.hpp"
#include "internal/model/source_document.hpp"
#include "relaynorm/v1/page_bundle.pb.h"
#include "relaynorm/v1/report.pb.h"

namespace relaynorm::strategy {

struct PageContent {
  relaynorm::v1::PageLayer          layer;
  std::vector<model::ParameterLine> lines;
  std::filesystem::path             raster_path; // empty for text documents
};

/*
  Everything extracted from one document before active-function
  detection. text is the decoded file for text documents and the text
  layer in reading order for page bundles.
*/
struct DocumentContent {
  model::SourceDocument    document;
  std::string              text;
  std::string              encoding;
  std::vector<PageContent> pages;
};

// Something a person should look at; ends up in the batch report.
struct ReviewNote {
  relaynorm::v1::ReviewKind kind = relaynorm::v1::REVIEW_KIND_UNSPECIFIED;
  std::string               detail;
  std::uint32_t             page_index = 0;
  std::string               parameter_code;
};

/*
  DetectionStrategy

  One implementation per detection method. Instances are built once per
  model profile, are immutable afterwards and are shared by all batch
  workers.
*/
class DetectionStrategy {
 public:
  virtual ~DetectionStrategy() = default;

  virtual model::DetectionMethod Method() const = 0;

  virtual std::vector<model::ActiveFlagResult> Detect(const DocumentContent& content, std::vector<ReviewNote>& notes) const = 0;

  // Parameter lines read from the document's own structure. nullopt
  // hands line extraction to the profile's code-token extractor.
  virtual std::optional<std::vector<model::ParameterLine>> StructuredLines(const DocumentContent&) const {
    return std::nullopt;
  }

  // Equipment tag stated inside the document, if the format carries one.
  virtual std::optional<std::string> EquipmentHint(const DocumentContent&) const {
    return std::nullopt;
  }
};

} // namespace relaynorm::strategy
