#include "strings.hpp"

namespace relaynorm::util {

namespace {

bool IsSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace

std::string Trim(std::string_view s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && IsSpace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && IsSpace(static_cast<unsigned char>(s[end - 1]))) --end;
  // non-breaking space (C2 A0) shows up in exported cells
  while (end - begin >= 2 && static_cast<unsigned char>(s[begin]) == 0xC2 && static_cast<unsigned char>(s[begin + 1]) == 0xA0) begin += 2;
  while (end - begin >= 2 && static_cast<unsigned char>(s[end - 2]) == 0xC2 && static_cast<unsigned char>(s[end - 1]) == 0xA0) end -= 2;
  return std::string(s.substr(begin, end - begin));
}

std::string FoldCase(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c >= 'A' && c <= 'Z') {
      out.push_back(static_cast<char>(c + 32));
      continue;
    }
    if (c == 0xC3 && i + 1 < s.size()) {
      const auto next = static_cast<unsigned char>(s[i + 1]);
      out.push_back(static_cast<char>(c));
      // U+00C0..U+00DE except U+00D7 (multiplication sign)
      if (next >= 0x80 && next <= 0x9E && next != 0x97) {
        out.push_back(static_cast<char>(next + 0x20));
      } else {
        out.push_back(static_cast<char>(next));
      }
      ++i;
      continue;
    }
    out.push_back(static_cast<char>(c));
  }
  return out;
}

bool EqualsFolded(std::string_view a, std::string_view b) {
  return FoldCase(a) == FoldCase(b);
}

bool EndsWithFolded(std::string_view s, std::string_view suffix) {
  if (suffix.size() > s.size()) return false;
  return FoldCase(s.substr(s.size() - suffix.size())) == FoldCase(suffix);
}

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t              start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      std::size_t end = i;
      if (end > start && text[end - 1] == '\r') --end;
      lines.emplace_back(text.substr(start, end - start));
      start = i + 1;
    }
  }
  if (start < text.size()) {
    std::size_t end = text.size();
    if (text[end - 1] == '\r') --end;
    lines.emplace_back(text.substr(start, end - start));
  }
  return lines;
}

std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out.append(separator);
    out.append(parts[i]);
  }
  return out;
}

std::string FormatCaptures(std::string_view format, const std::vector<std::string>& captures) {
  std::string out;
  out.reserve(format.size());
  for (std::size_t i = 0; i < format.size(); ++i) {
    if (format[i] == '{' && i + 2 < format.size() && format[i + 1] >= '1' && format[i + 1] <= '9' && format[i + 2] == '}') {
      const std::size_t index = static_cast<std::size_t>(format[i + 1] - '0');
      if (index < captures.size()) out.append(captures[index]);
      i += 2;
      continue;
    }
    out.push_back(format[i]);
  }
  return out;
}

} // namespace relaynorm::util
