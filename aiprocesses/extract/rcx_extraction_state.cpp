#include "rcx_extraction_state.h"

namespace rcx::extract {

rcx_string resolution_method_name(rcx_resolution_method method) {
  switch (method) {
    case rcx_resolution_method::inline_pattern:
      return "inline";
    case rcx_resolution_method::spatial:
      return "spatial";
    case rcx_resolution_method::sniffed:
      return "sniffed";
  }
  return "unknown";
}

bool rcx_field_resolution::operator==(const rcx_field_resolution& other) const {
  return key == other.key && raw_value == other.raw_value &&
         label_index == other.label_index && value_index == other.value_index &&
         method == other.method;
}

rcx_extraction_state::rcx_extraction_state(size_t fragment_count)
  : consumed(fragment_count, false)
{
}

bool rcx_extraction_state::is_consumed(size_t index) const {
  return index < consumed.size() && consumed[index];
}

bool rcx_extraction_state::is_resolved(const rcx_string& key) const {
  return resolved.find(key) != resolved.end();
}

bool rcx_extraction_state::commit(const rcx_field_resolution& resolution) {
  if (is_resolved(resolution.key)) {
    return false;
  }

  std::vector<size_t> indices;
  if (resolution.label_index != rcx_field_resolution::npos) {
    indices.push_back(resolution.label_index);
  }
  if (resolution.value_index != rcx_field_resolution::npos &&
      resolution.value_index != resolution.label_index) {
    indices.push_back(resolution.value_index);
  }
  if (indices.empty()) {
    return false;
  }
  for (size_t index : indices) {
    if (index >= consumed.size() || consumed[index]) {
      return false;
    }
  }

  for (size_t index : indices) {
    consumed[index] = true;
  }
  resolved[resolution.key] = resolution.raw_value;
  resolutions.push_back(resolution);
  return true;
}

} // namespace rcx::extract
