#ifndef RCX_RECEIPT_RESULT_H
#define RCX_RECEIPT_RESULT_H

#include "rcx_extraction_state.h"
#include "../../utils/rcx_datetime.h"
#include <map>
#include <optional>
#include <vector>

namespace rcx::extract {

enum class rcx_payment_mode {
  cash,
  upi,
  cheque,
  card
};

// "cash", "upi", "cheque", "card"
rcx_string payment_mode_name(rcx_payment_mode mode);
// Label shown on the expense form, e.g. "By UPI".
rcx_string payment_mode_label(rcx_payment_mode mode);

// Structured expense record used to pre-fill the expense form. Every field is
// optional in practice: absent values are empty strings, empty lists or nullopt.
struct rcx_receipt_result {
  std::optional<rcx_datetime> date;
  std::optional<double> amount;
  rcx_string description;
  std::vector<rcx_string> categories;
  rcx_payment_mode payment_mode = rcx_payment_mode::cash;
  rcx_string item_type;
  rcx_string item;
  rcx_string brand;
  rcx_string spec;
  rcx_string quantity;
  rcx_string unit_of_measure;
  rcx_string unit_price;

  // Every resolved raw value by field key, including fields without a typed slot.
  std::map<rcx_string, rcx_string> fields;
  std::vector<rcx_field_resolution> resolutions;

  bool operator==(const rcx_receipt_result& other) const;
  bool operator!=(const rcx_receipt_result& other) const { return !(*this == other); }
};

} // namespace rcx::extract

#endif // RCX_RECEIPT_RESULT_H
