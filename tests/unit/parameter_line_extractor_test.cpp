#include "internal/extract/parameter_line_extractor.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/config/defaults.hpp"
#include "internal/extract/page_bundle_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using relaynorm::extract::ParameterLineExtractor;
using relaynorm::runtime::config::ExtractorConfig;

ExtractorConfig DefaultExtractorConfig() {
  ExtractorConfig config;
  for (const auto& pattern : relaynorm::config::DefaultCodePatterns()) {
    config.add_code_patterns(pattern);
  }
  config.set_column_gap(150.0);
  config.set_line_merge_tolerance(3.0);
  return config;
}

void AddRun(relaynorm::v1::PageLayer& page, const std::string& text, double x, double y) {
  auto* run = page.add_runs();
  run->set_text(text);
  run->set_x(x);
  run->set_y(y);
  run->set_width(static_cast<double>(text.size()) * 5.0);
  run->set_height(10.0);
}

void TestCodeRecognition() {
  ParameterLineExtractor extractor(DefaultExtractorConfig());
  assert(extractor.IsCode("0160"));
  assert(extractor.IsCode("0160:"));
  assert(extractor.IsCode("010DA"));
  assert(extractor.IsCode("35.23"));
  assert(!extractor.IsCode("Frequency"));
  assert(!extractor.IsCode("1.2"));
  assert(!extractor.IsCode(""));
  assert(!extractor.IsCode(":"));
}

void TestTextPageRecords() {
  ParameterLineExtractor extractor(DefaultExtractorConfig());

  const auto page = relaynorm::extract::TextToPage(
      "Settings report\n"
      "0160: Frequency: 50 Hz\n"
      "0161  I>1 Current Set  1.2 A\n"
      "      continued description\n"
      "35.23  Opto Label (1/2)  Alpha\n",
      2);

  const auto lines = extractor.Extract(page);
  assert(lines.size() == 3);

  assert(lines[0].code == "0160");
  assert(lines[0].description == "Frequency");
  assert(lines[0].raw_value == "50 Hz");
  assert(lines[0].page_index == 2);

  assert(lines[1].code == "0161");
  assert(lines[1].description == "I>1 Current Set continued description");
  assert(lines[1].raw_value == "1.2 A");

  assert(lines[2].code == "35.23");
  assert(lines[2].description == "Opto Label (1/2)");
  assert(lines[2].raw_value == "Alpha");

  // reading order follows the page
  assert(lines[0].y < lines[1].y);
  assert(lines[1].y < lines[2].y);
}

void TestTwoColumnLayout() {
  ParameterLineExtractor extractor(DefaultExtractorConfig());

  relaynorm::v1::PageLayer page;
  page.set_index(0);
  AddRun(page, "0101", 10, 100);
  AddRun(page, "Setting A", 60, 100);
  AddRun(page, "5 A", 200, 100);
  AddRun(page, "0201", 400, 100);
  AddRun(page, "Setting B", 450, 100);
  AddRun(page, "10 s", 590, 100);
  AddRun(page, "0102", 10, 112);
  AddRun(page, "Ratio", 60, 112);
  AddRun(page, "1000", 200, 112);

  const auto lines = extractor.Extract(page);
  assert(lines.size() == 3);

  assert(lines[0].code == "0101");
  assert(lines[0].description == "Setting A");
  assert(lines[0].raw_value == "5 A");
  assert(lines[0].column == 0);
  assert(lines[0].y == 105.0);

  // a code-shaped value right of a description stays a value
  assert(lines[1].code == "0102");
  assert(lines[1].raw_value == "1000");
  assert(lines[1].column == 0);

  assert(lines[2].code == "0201");
  assert(lines[2].description == "Setting B");
  assert(lines[2].raw_value == "10 s");
  assert(lines[2].column == 1);
  assert(lines[2].x == 400.0);
}

void TestPageWithoutCodesIsEmpty() {
  ParameterLineExtractor extractor(DefaultExtractorConfig());
  const auto             page = relaynorm::extract::TextToPage("Cover page\nSubstation 52\n");
  assert(extractor.Extract(page).empty());
  assert(extractor.Extract(relaynorm::v1::PageLayer{}).empty());
}

void TestBlacklistedCodesAreIgnored() {
  auto config = DefaultExtractorConfig();
  config.add_code_blacklist("0000");
  ParameterLineExtractor extractor(config);

  const auto page  = relaynorm::extract::TextToPage("0000  Reserved  1\n0160  Frequency  50 Hz\n");
  const auto lines = extractor.Extract(page);
  assert(lines.size() == 1);
  assert(lines[0].code == "0160");
}

void TestInvalidPatternIsRejected() {
  ExtractorConfig config;
  config.add_code_patterns("[0-9");

  bool threw = false;
  try {
    ParameterLineExtractor extractor(config);
  } catch (const relaynorm::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCodeRecognition();
  TestTextPageRecords();
  TestTwoColumnLayout();
  TestPageWithoutCodesIsEmpty();
  TestBlacklistedCodesAreIgnored();
  TestInvalidPatternIsRejected();

  std::cout << "relaynorm_unit_parameter_line_extractor: pass\n";
  return 0;
}
