#ifndef RCX_PRECOMPUTED_RECOGNIZER_H
#define RCX_PRECOMPUTED_RECOGNIZER_H

#include "rcx_text_recognizer.h"

// Recognizer for text that was recognized elsewhere: serves a fixed fragment
// list regardless of the image it is given.
class rcx_precomputed_recognizer : public i_text_recognizer {
  std::vector<rcx_fragment> fragments;
  bool loaded;
  rcx_string load_error;

public:
  rcx_precomputed_recognizer();
  explicit rcx_precomputed_recognizer(const std::vector<rcx_fragment>& fragments_val);

  // Replaces the fragments with the contents of a fragments JSON file. On
  // failure the recognizer reports the load error from every recognize_text().
  bool load_file(const rcx_string& path);

  bool is_loaded() const { return loaded; }
  const std::vector<rcx_fragment>& get_fragments() const { return fragments; }

  bool recognize_text(const cv::Mat& image, std::vector<rcx_fragment>& out, rcx_string& error) override;
};

#endif // RCX_PRECOMPUTED_RECOGNIZER_H
