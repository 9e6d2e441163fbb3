#ifndef RCX_VALUE_RESOLVER_H
#define RCX_VALUE_RESOLVER_H

#include "rcx_extraction_config.h"
#include "rcx_field_matcher.h"
#include "rcx_numeric_cleaner.h"
#include "rcx_spatial_index.h"
#include <regex>
#include <vector>

namespace rcx::extract {

// Finds the value belonging to a label fragment. Patterns are compiled once in
// the constructor; all methods are const and safe to share between threads.
class rcx_value_resolver {
  const rcx_extraction_config& config;
  const rcx_numeric_cleaner& cleaner;

  std::vector<std::regex> numeric_patterns;
  std::vector<std::regex> date_patterns;

  const std::vector<std::regex>& patterns_for(rcx_value_kind kind) const;

  // Text after a '-' or ':' separator, trimmed.
  static bool separated_text(const rcx_string& remainder, rcx_string& value);

public:
  rcx_value_resolver(const rcx_extraction_config& config, const rcx_numeric_cleaner& cleaner);

  // Searches the label text after the matched alias with the patterns of the
  // field's value kind ("Qty - 5", "Total ₹450", "Qty 5 bags"). Text fields
  // take whatever follows a separator ("Brand: UltraTech").
  bool resolve_inline(const rcx_fragment& label, const rcx_label_match& match, rcx_string& value) const;

  // Nearest unconsumed fragment to the right of the label on the same or an
  // adjacent row bucket, within max_gap. Equal gaps go to the lower index.
  bool resolve_spatial(size_t label_index, const std::vector<rcx_fragment>& fragments,
                       const rcx_spatial_index& index, const rcx_extraction_state& state,
                       size_t& value_index) const;

  // Inline first, spatial only when inline fails. Commits to state on success.
  bool resolve(size_t label_index, const rcx_label_match& match, const std::vector<rcx_fragment>& fragments,
               const rcx_spatial_index& index, rcx_extraction_state& state) const;

  // Adopts the first unconsumed fragment that is a bare monetary number as the
  // amount when no amount label resolved. Commits to state on success.
  bool sniff_amount(const std::vector<rcx_fragment>& fragments, rcx_extraction_state& state) const;
};

} // namespace rcx::extract

#endif // RCX_VALUE_RESOLVER_H
