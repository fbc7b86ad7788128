#pragma once

#include <cstdint>
#include <string>

namespace relaynorm::db::model {

/*
  source_documents row.

  document_id is the path below the batch input directory:
  reprocessing the same export replaces the rows it wrote before, and
  same-named exports in different subdirectories stay apart.
*/
struct SourceDocumentRecord {
  std::string   document_id;
  std::string   file_name;
  std::string   equipment_tag;
  std::string   model_code;
  std::string   encoding;
  std::uint32_t page_count = 0;
  std::string   content_digest;
  std::uint64_t size_bytes      = 0;
  std::uint64_t processed_at_ms = 0;
};

} // namespace relaynorm::db::model
