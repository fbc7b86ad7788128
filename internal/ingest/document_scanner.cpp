#include "document_scanner.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "config/config.pb.h"
#include "internal/extract/page_bundle_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::ingest {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

std::string LowerExtension(const fs::path& path) {
  return util::FoldCase(path.extension().string());
}

} // namespace

DocumentScanner::DocumentScanner(const relaynorm::runtime::config::RuntimeConfig& config)
    : root_(fs::path(config.batch().input_directory()).lexically_normal()),
      bundle_suffixes_(config.batch().bundle_suffixes().begin(), config.batch().bundle_suffixes().end()) {
  // "exports/" -> "exports"
  if (!root_.empty() && !root_.has_filename()) root_ = root_.parent_path();
  text_extensions_.insert(".txt");
  for (const auto& profile : config.profiles()) {
    for (const auto& ext : profile.extensions()) {
      auto folded = util::FoldCase(ext);
      if (folded == ".pdf") continue; // rendered documents arrive as bundles
      text_extensions_.insert(std::move(folded));
    }
  }
}

std::string DocumentScanner::BundleSuffix(const std::string& file_name) const {
  for (const auto& suffix : bundle_suffixes_) {
    if (util::EndsWithFolded(file_name, suffix) && file_name.size() > suffix.size()) return suffix;
  }
  return {};
}

model::DocumentKind DocumentScanner::Classify(const fs::path& path) const {
  const auto name = path.filename().string();
  if (!BundleSuffix(name).empty()) return model::DocumentKind::kPageBundle;
  if (text_extensions_.count(LowerExtension(path)) != 0) return model::DocumentKind::kPlainText;
  return model::DocumentKind::kUnknown;
}

std::vector<fs::path> DocumentScanner::Scan(const fs::path& directory, bool recursive) const {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    throw util::InvalidInput("input directory '" + directory.string() + "' does not exist");
  }

  std::vector<fs::path> files;
  auto collect = [&files](const fs::directory_entry& entry) {
    if (entry.is_regular_file()) files.push_back(entry.path());
  };
  if (recursive) {
    for (const auto& entry : fs::recursive_directory_iterator(directory)) collect(entry);
  } else {
    for (const auto& entry : fs::directory_iterator(directory)) collect(entry);
  }

  // rasters owned by a bundle
  std::set<fs::path> owned;
  for (const auto& file : files) {
    if (Classify(file) != model::DocumentKind::kPageBundle) continue;
    try {
      const auto bundle = extract::PageBundleLoader::Load(file);
      for (const auto& page : bundle.pages()) {
        if (page.raster_path().empty()) continue;
        owned.insert(fs::weakly_canonical(extract::PageBundleLoader::ResolveRaster(file, page), ec));
      }
    } catch (const util::InvalidInput& e) {
      // reported again, per document, when the bundle is processed
      RELAYNORM_LOG_DEBUG("Bundle unreadable while scanning", {StringField("file", file.string()), StringField("error", e.what())});
    }
  }

  std::vector<fs::path> out;
  for (const auto& file : files) {
    if (owned.count(fs::weakly_canonical(file, ec)) != 0) continue;
    out.push_back(file);
  }
  std::sort(out.begin(), out.end());

  RELAYNORM_LOG_INFO("Input directory scanned",
                     {StringField("directory", directory.string()), IntField("files", static_cast<std::int64_t>(out.size())),
                      IntField("bundle_rasters", static_cast<std::int64_t>(owned.size()))});
  return out;
}

model::SourceDocument DocumentScanner::Describe(const fs::path& path, std::string_view bytes) const {
  model::SourceDocument doc;
  doc.path        = path;
  doc.document_id = DocumentId(path);
  doc.file_name   = path.filename().string();
  doc.size_bytes = bytes.size();
  doc.digest     = util::ContentDigest(bytes);
  doc.kind       = Classify(path);

  if (doc.kind == model::DocumentKind::kPageBundle) {
    // name of the rendered document: "X.pdf.pages.json" -> "X.pdf"
    doc.file_name.resize(doc.file_name.size() - BundleSuffix(doc.file_name).size());
    doc.extension = util::FoldCase(fs::path(doc.file_name).extension().string());
  } else {
    doc.extension = LowerExtension(path);
  }
  return doc;
}

std::string DocumentScanner::DocumentId(const fs::path& path) const {
  const auto normal = path.lexically_normal();
  if (root_.empty()) return normal.generic_string();

  const auto relative = normal.lexically_relative(root_);
  if (relative.empty() || *relative.begin() == "..") return normal.generic_string();
  return relative.generic_string();
}

std::string DocumentScanner::ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InvalidInput("cannot open '" + path.string() + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::InvalidInput("read error on '" + path.string() + "'");
  }
  return buffer.str();
}

} // namespace relaynorm::ingest
