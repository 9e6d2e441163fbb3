#include "rcx_fragment.h"

rcx_fragment::rcx_fragment() {}

rcx_fragment::rcx_fragment(const rcx_string& text_val, double x_val, double y_val,
                           double width_val, double height_val, double confidence_val)
  : rcx_layout_bounds(x_val, y_val, width_val, height_val)
  , text(text_val)
  , confidence(confidence_val)
{
}

bool rcx_fragment::operator==(const rcx_fragment& other) const {
  return rcx_layout_bounds::operator==(other) && text == other.text && confidence == other.confidence;
}
