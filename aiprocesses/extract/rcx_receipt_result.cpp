#include "rcx_receipt_result.h"

namespace rcx::extract {

rcx_string payment_mode_name(rcx_payment_mode mode) {
  switch (mode) {
    case rcx_payment_mode::cash:
      return "cash";
    case rcx_payment_mode::upi:
      return "upi";
    case rcx_payment_mode::cheque:
      return "cheque";
    case rcx_payment_mode::card:
      return "card";
  }
  return "cash";
}

rcx_string payment_mode_label(rcx_payment_mode mode) {
  switch (mode) {
    case rcx_payment_mode::cash:
      return "By cash";
    case rcx_payment_mode::upi:
      return "By UPI";
    case rcx_payment_mode::cheque:
      return "By cheque";
    case rcx_payment_mode::card:
      return "By Card";
  }
  return "By cash";
}

bool rcx_receipt_result::operator==(const rcx_receipt_result& other) const {
  return date == other.date && amount == other.amount && description == other.description &&
         categories == other.categories && payment_mode == other.payment_mode &&
         item_type == other.item_type && item == other.item && brand == other.brand &&
         spec == other.spec && quantity == other.quantity && unit_of_measure == other.unit_of_measure &&
         unit_price == other.unit_price && fields == other.fields && resolutions == other.resolutions;
}

} // namespace rcx::extract
