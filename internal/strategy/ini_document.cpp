#include "ini_document.hpp"

#include <algorithm>

#include "internal/util/strings.hpp"

namespace relaynorm::strategy {

IniDocument IniDocument::Parse(std::string_view text) {
  IniDocument doc;
  Section*    current = nullptr;

  auto open = [&](const std::string& name) {
    auto it = std::find_if(doc.sections_.begin(), doc.sections_.end(), [&](const Section& s) { return util::EqualsFolded(s.name, name); });
    if (it == doc.sections_.end()) {
      doc.sections_.push_back({name, {}});
      return &doc.sections_.back();
    }
    return &*it;
  };

  for (const auto& raw_line : util::SplitLines(text)) {
    const auto line = util::Trim(raw_line);
    if (line.empty() || line.front() == ';' || line.front() == '#') continue;

    if (line.front() == '[') {
      const auto close = line.find(']');
      if (close == std::string::npos) continue;
      current = open(util::Trim(std::string_view(line).substr(1, close - 1)));
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    if (current == nullptr) current = open("");
    current->entries.emplace_back(util::Trim(std::string_view(line).substr(0, eq)), util::Trim(std::string_view(line).substr(eq + 1)));
  }
  return doc;
}

const IniDocument::Section* IniDocument::Find(std::string_view name) const {
  auto it = std::find_if(sections_.begin(), sections_.end(), [&](const Section& s) { return util::EqualsFolded(s.name, name); });
  return it == sections_.end() ? nullptr : &*it;
}

std::optional<std::string> IniDocument::Value(std::string_view section, std::string_view key) const {
  const auto* found = Find(section);
  if (found == nullptr) return std::nullopt;
  for (const auto& [k, v] : found->entries) {
    if (util::EqualsFolded(k, key)) return v;
  }
  return std::nullopt;
}

std::size_t IniDocument::SectionCount() const {
  return static_cast<std::size_t>(std::count_if(sections_.begin(), sections_.end(), [](const Section& s) { return !s.name.empty(); }));
}

} // namespace relaynorm::strategy
