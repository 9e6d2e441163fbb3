#ifndef RCX_TEXT_NORMALIZER_H
#define RCX_TEXT_NORMALIZER_H

#include "../../documents/receipt/rcx_fragment.h"
#include <vector>

namespace rcx::extract {

// Turns raw recognizer output into the reading-ordered fragment list the
// matching pass works on.
class rcx_text_normalizer {
  double confidence_floor;

public:
  // Longest fragment text kept, in bytes. A printed receipt line is far shorter.
  static constexpr size_t max_text_bytes = 1024;

  explicit rcx_text_normalizer(double confidence_floor = 0.3);

  // Drops fragments below the confidence floor, without text or with a box
  // outside the image, cleans the text (UTF-8 repair, whitespace collapse, trim,
  // cut to max_text_bytes) and sorts top to bottom, then left to right.
  // Fragments on an identical position keep their input order.
  std::vector<rcx_fragment> normalize(const std::vector<rcx_fragment>& fragments) const;

  double get_confidence_floor() const { return confidence_floor; }
};

} // namespace rcx::extract

#endif // RCX_TEXT_NORMALIZER_H
