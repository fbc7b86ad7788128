#pragma once

namespace relaynorm::model {

struct PixelBox {
  int x      = 0;
  int y      = 0;
  int width  = 0;
  int height = 0;

  int Right() const {
    return x + width;
  }
  int Bottom() const {
    return y + height;
  }
  int Area() const {
    return width * height;
  }
};

struct CheckboxMark {
  PixelBox box;

  double center_x = 0.0;
  double center_y = 0.0;

  // dark pixels / interior pixels
  double density    = 0.0;
  double saturation = 0.0;
  bool   marked     = false;
};

} // namespace relaynorm::model
