#ifndef RCX_RESULT_ASSEMBLER_H
#define RCX_RESULT_ASSEMBLER_H

#include "rcx_date_parser.h"
#include "rcx_numeric_cleaner.h"
#include "rcx_receipt_result.h"
#include "../../documents/receipt/rcx_fragment.h"
#include <regex>
#include <utility>

namespace rcx::extract {

// Converts the raw field map of one extraction pass into the typed result.
class rcx_result_assembler {
  const rcx_numeric_cleaner& cleaner;
  const rcx_date_parser& dates;
  std::vector<std::pair<rcx_payment_mode, std::vector<rcx_string>>> payment_keywords;
  std::regex quantity_with_unit;

public:
  rcx_result_assembler(const rcx_numeric_cleaner& cleaner, const rcx_date_parser& dates);

  // "Cement, Steel ,, Sand" -> {"Cement", "Steel", "Sand"}
  std::vector<rcx_string> split_categories(const rcx_string& raw) const;

  // First keyword group (upi, cheque, card) with a keyword contained in text;
  // cash when none matches.
  rcx_payment_mode classify_payment(const rcx_string& text) const;

  // Cleaned number text, empty when the value is not numeric.
  rcx_string clean_number_text(const rcx_string& raw) const;

  // "5 bags" -> number "5", unit "bags". False unless raw is a number followed
  // by a unit word.
  bool split_number_unit(const rcx_string& raw, rcx_string& number, rcx_string& unit) const;

  // Never throws on missing or malformed fields. fragments is the normalized
  // list the state refers to; it is scanned for payment keywords when no
  // payment field was resolved.
  rcx_receipt_result assemble(const rcx_extraction_state& state, const std::vector<rcx_fragment>& fragments) const;
};

} // namespace rcx::extract

#endif // RCX_RESULT_ASSEMBLER_H
