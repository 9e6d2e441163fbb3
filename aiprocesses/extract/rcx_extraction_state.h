#ifndef RCX_EXTRACTION_STATE_H
#define RCX_EXTRACTION_STATE_H

#include "../../utils/rcx_string.h"
#include <map>
#include <vector>

namespace rcx::extract {

enum class rcx_resolution_method {
  inline_pattern, // value found inside the label fragment
  spatial,        // value taken from the nearest fragment to the right
  sniffed         // unlabeled monetary token adopted as amount
};

rcx_string resolution_method_name(rcx_resolution_method method);

struct rcx_field_resolution {
  static constexpr size_t npos = static_cast<size_t>(-1);

  rcx_string key;
  rcx_string raw_value;
  size_t label_index = npos;  // npos for sniffed values
  size_t value_index = npos;  // npos for inline values
  rcx_resolution_method method = rcx_resolution_method::inline_pattern;

  bool operator==(const rcx_field_resolution& other) const;
};

// Mutable bookkeeping of one analyze() call. Fragment indices refer to the
// normalized fragment list.
class rcx_extraction_state {
  std::vector<bool> consumed;
  std::map<rcx_string, rcx_string> resolved;
  std::vector<rcx_field_resolution> resolutions;

public:
  explicit rcx_extraction_state(size_t fragment_count);

  size_t fragment_count() const { return consumed.size(); }
  bool is_consumed(size_t index) const;
  bool is_resolved(const rcx_string& key) const;

  // Records the resolution and consumes its label/value fragments. Returns false
  // without changing anything when the key is already resolved or one of the
  // fragments is out of range or already consumed.
  bool commit(const rcx_field_resolution& resolution);

  const std::map<rcx_string, rcx_string>& get_resolved() const { return resolved; }
  const std::vector<rcx_field_resolution>& get_resolutions() const { return resolutions; }
};

} // namespace rcx::extract

#endif // RCX_EXTRACTION_STATE_H
