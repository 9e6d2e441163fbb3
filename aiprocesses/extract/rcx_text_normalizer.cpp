#include "rcx_text_normalizer.h"
#include <algorithm>

namespace rcx::extract {

namespace {

// Cuts at a code point boundary so the result stays valid UTF-8.
rcx_string truncate_utf8(const rcx_string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    --end;
  }
  return text.substr(0, end).trim();
}

} // namespace

rcx_text_normalizer::rcx_text_normalizer(double confidence_floor_val)
  : confidence_floor(confidence_floor_val)
{
}

std::vector<rcx_fragment> rcx_text_normalizer::normalize(const std::vector<rcx_fragment>& fragments) const {
  std::vector<rcx_fragment> usable;
  usable.reserve(fragments.size());

  for (const auto& fragment : fragments) {
    if (!(fragment.confidence >= confidence_floor) || !fragment.is_within_unit_square()) {
      continue;
    }
    rcx_string text = truncate_utf8(fragment.text.normalize_whitespace(), max_text_bytes);
    if (text.empty()) {
      continue;
    }
    rcx_fragment cleaned = fragment;
    cleaned.text = text;
    usable.push_back(cleaned);
  }

  std::stable_sort(usable.begin(), usable.end(), [](const rcx_fragment& a, const rcx_fragment& b) {
    if (a.get_top() != b.get_top()) {
      return a.get_top() < b.get_top();
    }
    return a.get_left() < b.get_left();
  });

  return usable;
}

} // namespace rcx::extract
