#ifndef RCX_RECEIPT_SCANNER_H
#define RCX_RECEIPT_SCANNER_H

#include "rcx_text_recognizer.h"
#include "../../aiprocesses/extract/rcx_receipt_analyzer.h"

// Decodes a receipt image, runs the OCR collaborator on it and analyzes the
// recognized fragments. Each call runs to completion; there is no retry.
//
// Throws rcx_image_processing_failure, rcx_recognition_failure or
// rcx_parsing_failure (all in rcx::extract).
class rcx_receipt_scanner {
  const rcx::extract::rcx_receipt_analyzer& analyzer;
  i_text_recognizer& recognizer;

public:
  rcx_receipt_scanner(const rcx::extract::rcx_receipt_analyzer& analyzer_ref, i_text_recognizer& recognizer_ref);

  rcx::extract::rcx_receipt_result scan_file(const rcx_string& path);
  rcx::extract::rcx_receipt_result scan_bytes(const std::vector<unsigned char>& bytes);
  rcx::extract::rcx_receipt_result scan_image(const cv::Mat& image);
};

#endif // RCX_RECEIPT_SCANNER_H
