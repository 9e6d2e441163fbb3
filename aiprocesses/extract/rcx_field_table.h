#ifndef RCX_FIELD_TABLE_H
#define RCX_FIELD_TABLE_H

#include "../../utils/rcx_string.h"
#include <vector>

namespace rcx::extract {

// Selects which inline patterns apply to a field's value.
enum class rcx_value_kind {
  numeric,
  date,
  text
};

struct rcx_field_definition {
  rcx_string key;
  std::vector<rcx_string> aliases; // lowercase
  rcx_value_kind kind;
};

// Ordered, immutable table of known receipt fields. Order decides which field
// wins when a label contains aliases of several fields.
class rcx_field_table {
  rcx_string version;
  std::vector<rcx_field_definition> definitions;

public:
  // Throws std::invalid_argument on duplicate keys or empty alias lists.
  rcx_field_table(const rcx_string& version, std::vector<rcx_field_definition> definitions);

  // The built-in expense form table, constructed once on first use.
  static const rcx_field_table& standard();

  const rcx_string& get_version() const { return version; }
  const std::vector<rcx_field_definition>& get_definitions() const { return definitions; }
  size_t size() const { return definitions.size(); }

  // nullptr when the key is unknown
  const rcx_field_definition* find(const rcx_string& key) const;
};

// Field keys the assembler reads.
namespace field_keys {
  extern const char* const date;
  extern const char* const amount;
  extern const char* const categories;
  extern const char* const mode_of_payment;
  extern const char* const description;
  extern const char* const item_type;
  extern const char* const item;
  extern const char* const brand;
  extern const char* const spec;
  extern const char* const quantity;
  extern const char* const unit_price;
  extern const char* const uom;
}

} // namespace rcx::extract

#endif // RCX_FIELD_TABLE_H
