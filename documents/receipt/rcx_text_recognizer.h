#ifndef RCX_TEXT_RECOGNIZER_H
#define RCX_TEXT_RECOGNIZER_H

#include "rcx_fragment.h"
#include <opencv2/core.hpp>
#include <vector>

// OCR collaborator. Implementations fill out with fragments in normalized
// top-left coordinates and return true, or return false and describe the
// failure in error.
class i_text_recognizer {
public:
  virtual ~i_text_recognizer() = default;

  virtual bool recognize_text(const cv::Mat& image, std::vector<rcx_fragment>& out, rcx_string& error) = 0;
};

#endif // RCX_TEXT_RECOGNIZER_H
