#ifndef RCX_ANALYSIS_EXCEPTIONS_H
#define RCX_ANALYSIS_EXCEPTIONS_H

#include "../../utils/rcx_string.h"
#include <exception>

// ============================================================================
// ANALYSIS EXCEPTION HIERARCHY
// ============================================================================
//
// Terminal failures of one receipt analysis. Everything below this level
// (missing field, bad date, non-numeric token) is reported as an absent value.
//
// rcx_analysis_exception (base)
// ├── rcx_image_processing_failure   image could not be read or decoded
// ├── rcx_recognition_failure        the text recognizer reported an error
// └── rcx_parsing_failure            no usable fragment after normalization
//
// ============================================================================

namespace rcx::extract {

class rcx_analysis_exception : public std::exception {
protected:
  rcx_string message_;

public:
  explicit rcx_analysis_exception(const rcx_string& message)
    : message_(message) {}

  virtual ~rcx_analysis_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

class rcx_image_processing_failure : public rcx_analysis_exception {
  rcx_string source_;

public:
  explicit rcx_image_processing_failure(const rcx_string& message, const rcx_string& source = rcx_string())
    : rcx_analysis_exception(message), source_(source) {}

  rcx_string get_source() const { return source_; }
};

class rcx_recognition_failure : public rcx_analysis_exception {
public:
  using rcx_analysis_exception::rcx_analysis_exception;
};

class rcx_parsing_failure : public rcx_analysis_exception {
  size_t fragment_count_;

public:
  rcx_parsing_failure(const rcx_string& message, size_t fragment_count)
    : rcx_analysis_exception(message), fragment_count_(fragment_count) {}

  // Number of fragments received before normalization dropped them all.
  size_t get_fragment_count() const { return fragment_count_; }
};

} // namespace rcx::extract

#endif // RCX_ANALYSIS_EXCEPTIONS_H
