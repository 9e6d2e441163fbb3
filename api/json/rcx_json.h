#ifndef RCX_JSON_H
#define RCX_JSON_H

#include "../../documents/receipt/rcx_fragment.h"
#include "../../aiprocesses/extract/rcx_receipt_result.h"
#include <vector>

// nlohmann::json stays out of this header.

class rcx_json {
public:
  /**
   * @brief Parses a fragments document into out.
   * @param json_string Either an array of fragments or an object with a
   * "fragments" array. Each fragment carries "text", optional "confidence"
   * (defaults to 1.0) and a "box" {x, y, width, height} or a "boundingBox"
   * {minX, minY, width, height}.
   * @return true on success. On failure the reason is written to std::cerr and
   * out is left empty.
   */
  static bool parse_fragments(const rcx_string& json_string, std::vector<rcx_fragment>& out);

  // Same as parse_fragments() on the contents of a file.
  static bool read_fragments_file(const rcx_string& path, std::vector<rcx_fragment>& out);

  /**
   * @brief Serializes an analysis result.
   * @return The JSON document, or an empty string when serialization failed.
   */
  static rcx_string create(const rcx::extract::rcx_receipt_result& result, bool pretty = false);

  // Serializes fragments in the "box" layout accepted by parse_fragments().
  static rcx_string create(const std::vector<rcx_fragment>& fragments, bool pretty = false);
};

#endif // RCX_JSON_H
