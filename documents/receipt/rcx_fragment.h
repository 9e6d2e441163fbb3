#ifndef RCX_FRAGMENT_H
#define RCX_FRAGMENT_H

#include "../layout/rcx_layout_bounds.h"
#include "../../utils/rcx_string.h"

// One OCR-recognized text span with its position and recognition confidence.
class rcx_fragment : public rcx_layout_bounds
{
public:
  rcx_string text;
  double confidence = 1.0; // 0.0-1.0

  rcx_fragment();
  rcx_fragment(const rcx_string& text_val, double x_val, double y_val,
               double width_val, double height_val, double confidence_val = 1.0);

  bool operator==(const rcx_fragment& other) const;
};

#endif // RCX_FRAGMENT_H
