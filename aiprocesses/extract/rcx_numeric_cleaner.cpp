#include "rcx_numeric_cleaner.h"
#include <cmath>

namespace rcx::extract {

rcx_numeric_cleaner::rcx_numeric_cleaner()
  // longer codes first, "rs." before "rs"
  : currency_tokens({"inr", "rs.", "rs", "₹", "$", "€", "£", "/-"})
{
}

rcx_string rcx_numeric_cleaner::clean(const rcx_string& raw) const {
  rcx_string result = raw.to_lower();
  for (const auto& token : currency_tokens) {
    result = result.remove(token);
  }
  result = result.remove(",");
  return result.remove_whitespace();
}

bool rcx_numeric_cleaner::parse(const rcx_string& raw, double& value) const {
  rcx_string cleaned = clean(raw);
  if (!cleaned.is_numeric()) {
    return false;
  }
  double parsed = cleaned.to_double(NAN);
  if (std::isnan(parsed) || std::isinf(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

bool rcx_numeric_cleaner::looks_monetary(const rcx_string& raw, double& value) const {
  double parsed = 0.0;
  if (!parse(raw, parsed)) {
    return false;
  }
  if (clean(raw).contains(".") || parsed > 10.0) {
    value = parsed;
    return true;
  }
  return false;
}

} // namespace rcx::extract
