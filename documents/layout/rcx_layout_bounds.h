#ifndef RCX_LAYOUT_BOUNDS_H
#define RCX_LAYOUT_BOUNDS_H

// Axis-aligned box in normalized image coordinates: origin top-left, x grows to
// the right, y grows downward, the full image spans [0,1] on both axes.
class rcx_layout_bounds
{
public:
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  rcx_layout_bounds();
  rcx_layout_bounds(double x_val, double y_val, double width_val, double height_val);

  double get_left() const;
  double get_right() const;
  double get_top() const;
  double get_bottom() const;
  double get_center_x() const;
  double get_center_y() const;

  // Signed distance from this box's right edge to the left edge of other.
  // Negative when other starts before this box ends.
  double horizontal_gap_to(const rcx_layout_bounds& other) const;

  // True when all values are finite, width and height are not negative and the
  // box lies inside [0,1] on both axes.
  bool is_within_unit_square() const;

  bool operator==(const rcx_layout_bounds& other) const;
};

#endif // RCX_LAYOUT_BOUNDS_H
