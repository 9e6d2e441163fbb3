#include "rcx_receipt_scanner.h"
#include <opencv2/imgcodecs.hpp>
#include <iostream>

using namespace rcx::extract;

rcx_receipt_scanner::rcx_receipt_scanner(const rcx_receipt_analyzer& analyzer_ref, i_text_recognizer& recognizer_ref)
  : analyzer(analyzer_ref)
  , recognizer(recognizer_ref)
{
}

rcx_receipt_result rcx_receipt_scanner::scan_file(const rcx_string& path) {
  if (path.empty()) {
    throw rcx_image_processing_failure("No image path given");
  }

  cv::Mat image;
  try {
    image = cv::imread(path.c_str(), cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw rcx_image_processing_failure(rcx_string("Image could not be read: ") + e.what(), path);
  }
  if (image.empty()) {
    throw rcx_image_processing_failure("Image could not be read or decoded", path);
  }
  return scan_image(image);
}

rcx_receipt_result rcx_receipt_scanner::scan_bytes(const std::vector<unsigned char>& bytes) {
  if (bytes.empty()) {
    throw rcx_image_processing_failure("Empty image buffer");
  }

  cv::Mat image;
  try {
    image = cv::imdecode(bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw rcx_image_processing_failure(rcx_string("Image could not be decoded: ") + e.what());
  }
  if (image.empty()) {
    throw rcx_image_processing_failure("Image buffer could not be decoded");
  }
  return scan_image(image);
}

rcx_receipt_result rcx_receipt_scanner::scan_image(const cv::Mat& image) {
  if (image.empty()) {
    throw rcx_image_processing_failure("Empty image");
  }

  std::vector<rcx_fragment> fragments;
  rcx_string error;
  if (!recognizer.recognize_text(image, fragments, error)) {
    throw rcx_recognition_failure(error.empty() ? rcx_string("Text recognition failed") : error);
  }

  if (analyzer.get_config().verbose) {
    std::cerr << "[recture] recognized " << fragments.size() << " fragments in "
              << image.cols << "x" << image.rows << " image" << std::endl;
  }
  return analyzer.analyze(fragments);
}
