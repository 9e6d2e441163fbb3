#include "rcx_field_matcher.h"

namespace rcx::extract {

rcx_field_matcher::rcx_field_matcher(const rcx_field_table& table_val)
  : table(table_val)
{
}

bool rcx_field_matcher::match(const rcx_string& text, const rcx_extraction_state& state, rcx_label_match& out) const {
  rcx_string lowered = text.to_lower();

  for (const auto& def : table.get_definitions()) {
    if (state.is_resolved(def.key)) {
      continue;
    }

    bool found = false;
    rcx_label_match best;
    for (const auto& alias : def.aliases) {
      size_t pos = lowered.find(alias);
      if (pos == rcx_string::npos) {
        continue;
      }
      if (!found || pos < best.alias_begin ||
          (pos == best.alias_begin && alias.size() > best.alias.size())) {
        best.field = &def;
        best.alias = alias;
        best.alias_begin = pos;
        best.alias_end = pos + alias.size();
        found = true;
      }
    }

    if (found) {
      out = best;
      return true;
    }
  }
  return false;
}

} // namespace rcx::extract
