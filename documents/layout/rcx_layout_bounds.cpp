#include "rcx_layout_bounds.h"
#include <cmath>

rcx_layout_bounds::rcx_layout_bounds() {}

rcx_layout_bounds::rcx_layout_bounds(double x_val, double y_val, double width_val, double height_val)
  : x(x_val), y(y_val), width(width_val), height(height_val)
{
}

double rcx_layout_bounds::get_left() const {
  return x;
}

double rcx_layout_bounds::get_right() const {
  return x + width;
}

double rcx_layout_bounds::get_top() const {
  return y;
}

double rcx_layout_bounds::get_bottom() const {
  return y + height;
}

double rcx_layout_bounds::get_center_x() const {
  return x + width / 2.0;
}

double rcx_layout_bounds::get_center_y() const {
  return y + height / 2.0;
}

double rcx_layout_bounds::horizontal_gap_to(const rcx_layout_bounds& other) const {
  return other.get_left() - get_right();
}

bool rcx_layout_bounds::is_within_unit_square() const {
  if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(width) || !std::isfinite(height)) {
    return false;
  }
  if (width < 0.0 || height < 0.0) {
    return false;
  }
  return x >= 0.0 && y >= 0.0 && get_right() <= 1.0 && get_bottom() <= 1.0;
}

bool rcx_layout_bounds::operator==(const rcx_layout_bounds& other) const {
  return x == other.x && y == other.y && width == other.width && height == other.height;
}
