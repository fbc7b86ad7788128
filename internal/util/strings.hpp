#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace relaynorm::util {

std::string Trim(std::string_view s);

// ASCII plus the Latin-1 supplement letters encoded as UTF-8 (À..Þ)
std::string FoldCase(std::string_view s);

bool EqualsFolded(std::string_view a, std::string_view b);

bool EndsWithFolded(std::string_view s, std::string_view suffix);

std::vector<std::string> SplitLines(std::string_view text);

std::string Join(const std::vector<std::string>& parts, std::string_view separator);

// Replaces {1}..{9} with the given captures; out of range indices become empty.
std::string FormatCaptures(std::string_view format, const std::vector<std::string>& captures);

} // namespace relaynorm::util
