#ifndef RCX_FIELD_MATCHER_H
#define RCX_FIELD_MATCHER_H

#include "rcx_field_table.h"
#include "rcx_extraction_state.h"

namespace rcx::extract {

struct rcx_label_match {
  const rcx_field_definition* field = nullptr;
  rcx_string alias;
  size_t alias_begin = 0;
  size_t alias_end = 0; // byte offset just past the alias in the fragment text
};

// Finds which field, if any, a fragment labels.
class rcx_field_matcher {
  const rcx_field_table& table;

public:
  explicit rcx_field_matcher(const rcx_field_table& table);

  // Case-insensitive substring match against the aliases of every field that
  // is not yet resolved in state. The first matching field in table order wins;
  // within that field the earliest alias occurrence (longest on a tie) is
  // reported.
  bool match(const rcx_string& text, const rcx_extraction_state& state, rcx_label_match& out) const;
};

} // namespace rcx::extract

#endif // RCX_FIELD_MATCHER_H
