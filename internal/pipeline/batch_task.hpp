#pragma once

#include <cstddef>
#include <filesystem>

namespace relaynorm::pipeline {

struct BatchTask {
  std::filesystem::path path;
  std::size_t           sequence = 0; // position in the scan
};

} // namespace relaynorm::pipeline
