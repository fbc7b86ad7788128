#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relaynorm::strategy {

/*
  Minimal INI reader for keyed-section exports.

    [Section]        section header
    key=value        entry (whitespace around both trimmed)
    ; or #           comment line

  Section and key lookups ignore case. Entries before the first header
  belong to an unnamed section. Duplicate sections are merged in file
  order.
*/
class IniDocument {
 public:
  using Entry = std::pair<std::string, std::string>;

  struct Section {
    std::string        name;
    std::vector<Entry> entries;
  };

  static IniDocument Parse(std::string_view text);

  const Section* Find(std::string_view name) const;

  std::optional<std::string> Value(std::string_view section, std::string_view key) const;

  // named sections only
  std::size_t SectionCount() const;

  const std::vector<Section>& Sections() const {
    return sections_;
  }

 private:
  std::vector<Section> sections_;
};

} // namespace relaynorm::strategy
