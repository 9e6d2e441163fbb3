#ifndef RCX_NUMERIC_CLEANER_H
#define RCX_NUMERIC_CLEANER_H

#include "../../utils/rcx_string.h"
#include <vector>

namespace rcx::extract {

// Normalizes printed money and quantity strings ("₹ 12,450.00", "Rs.500/-").
class rcx_numeric_cleaner {
  std::vector<rcx_string> currency_tokens;

public:
  rcx_numeric_cleaner();

  // Strips currency symbols/codes, thousands separators, the "/-" suffix and all
  // whitespace. Never throws.
  rcx_string clean(const rcx_string& raw) const;

  // True when the cleaned text is a plain decimal number; value receives it.
  bool parse(const rcx_string& raw, double& value) const;

  // parse() plus the "looks monetary" test: a decimal point or a value above 10.
  bool looks_monetary(const rcx_string& raw, double& value) const;
};

} // namespace rcx::extract

#endif // RCX_NUMERIC_CLEANER_H
