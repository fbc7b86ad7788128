#include "internal/ingest/document_scanner.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "config/config.pb.h"

namespace {

namespace fs = std::filesystem;

using relaynorm::ingest::DocumentScanner;
using relaynorm::model::DocumentKind;
using relaynorm::runtime::config::RuntimeConfig;

RuntimeConfig WithInput(const std::string& input_directory) {
  RuntimeConfig config;
  config.mutable_batch()->set_input_directory(input_directory);
  config.mutable_batch()->add_bundle_suffixes(".pages.json");
  auto* sepam = config.add_profiles();
  sepam->set_name("sepam_s40");
  sepam->add_extensions(".S40");
  sepam->add_extensions(".pdf");
  return config;
}

void TestDocumentIdIsRelativeToInput() {
  const DocumentScanner scanner(WithInput("/data/exports"));
  assert(scanner.DocumentId("/data/exports/export.txt") == "export.txt");
  assert(scanner.DocumentId("/data/exports/a/export.txt") == "a/export.txt");
  assert(scanner.DocumentId("/data/exports/b/./export.txt") == "b/export.txt");
  assert(scanner.DocumentId("/data/exports/a/export.txt") != scanner.DocumentId("/data/exports/b/export.txt"));

  // trailing separator on the input directory
  const DocumentScanner slashed(WithInput("/data/exports/"));
  assert(slashed.DocumentId("/data/exports/a/export.txt") == "a/export.txt");

  // outside the input directory: full path
  assert(scanner.DocumentId("/elsewhere/export.txt") == "/elsewhere/export.txt");

  const DocumentScanner unrooted(WithInput(""));
  assert(unrooted.DocumentId("in/a/export.txt") == "in/a/export.txt");
}

void TestDescribeCarriesDocumentId() {
  const DocumentScanner scanner(WithInput("/data/exports"));

  const auto text = scanner.Describe("/data/exports/b/feeder.S40", "[A]\nk=v\n");
  assert(text.document_id == "b/feeder.S40");
  assert(text.file_name == "feeder.S40");
  assert(text.extension == ".s40");
  assert(text.kind == DocumentKind::kPlainText);
  assert(text.size_bytes == 8);

  // bundles keep their own path as id and the rendered name as file name
  const auto bundle = scanner.Describe("/data/exports/p3/52-DJ-01.pdf.pages.json", "{}");
  assert(bundle.document_id == "p3/52-DJ-01.pdf.pages.json");
  assert(bundle.file_name == "52-DJ-01.pdf");
  assert(bundle.extension == ".pdf");
  assert(bundle.kind == DocumentKind::kPageBundle);
}

void TestClassify() {
  const DocumentScanner scanner(WithInput("/data/exports"));
  assert(scanner.Classify("x.txt") == DocumentKind::kPlainText);
  assert(scanner.Classify("x.s40") == DocumentKind::kPlainText);
  // rendered documents only arrive as bundles
  assert(scanner.Classify("x.pdf") == DocumentKind::kUnknown);
  assert(scanner.Classify("x.pdf.pages.json") == DocumentKind::kPageBundle);
  assert(scanner.Classify(".pages.json") == DocumentKind::kUnknown);
  assert(scanner.Classify("readme.docx") == DocumentKind::kUnknown);
}

void TestScanSortsAndRecurses() {
  const auto root = fs::temp_directory_path() / "relaynorm_document_scanner_test";
  fs::remove_all(root);
  fs::create_directories(root / "b");
  fs::create_directories(root / "a");
  for (const auto& file : {root / "b" / "export.txt", root / "a" / "export.txt", root / "top.txt"}) {
    std::ofstream out(file);
    out << "35.23: x: 1\n";
  }

  const DocumentScanner scanner(WithInput(root.string()));
  const auto            flat = scanner.Scan(root, false);
  assert(flat.size() == 1);
  assert(flat[0].filename() == "top.txt");

  const auto all = scanner.Scan(root, true);
  assert(all.size() == 3);
  assert(scanner.DocumentId(all[0]) == "a/export.txt");
  assert(scanner.DocumentId(all[1]) == "b/export.txt");
  assert(scanner.DocumentId(all[2]) == "top.txt");

  fs::remove_all(root);
}

} // namespace

int main() {
  TestDocumentIdIsRelativeToInput();
  TestDescribeCarriesDocumentId();
  TestClassify();
  TestScanSortsAndRecurses();

  std::cout << "relaynorm_unit_document_scanner: pass\n";
  return 0;
}
