#pragma once

#include <cstdint>
#include <string>

namespace relaynorm::model {

/*
  One coded row of a settings page.

  Positions are in text-layer units; y grows downwards and is the
  vertical centre of the line.
*/
struct ParameterLine {
  std::string code;
  std::string description;
  std::string raw_value;

  double x = 0.0; // left edge of the code token
  double y = 0.0;

  std::uint32_t column     = 0;
  std::uint32_t page_index = 0;
};

} // namespace relaynorm::model
