#include "rcx_result_assembler.h"
#include "rcx_field_table.h"

namespace rcx::extract {

namespace {

rcx_string raw_field(const std::map<rcx_string, rcx_string>& resolved, const char* key) {
  auto it = resolved.find(key);
  return it == resolved.end() ? rcx_string() : it->second.trim();
}

} // namespace

rcx_result_assembler::rcx_result_assembler(const rcx_numeric_cleaner& cleaner_val, const rcx_date_parser& dates_val)
  : cleaner(cleaner_val)
  , dates(dates_val)
  , payment_keywords({
      {rcx_payment_mode::upi, {"upi", "gpay", "google pay", "phonepe", "phone pe", "paytm", "bhim"}},
      {rcx_payment_mode::cheque, {"cheque", "check", "chq"}},
      {rcx_payment_mode::card, {"card", "visa", "mastercard", "rupay", "debit", "credit"}},
    })
  , quantity_with_unit("^\\s*(\\d[\\d,]*(?:\\.\\d+)?)\\s*([a-z][a-z. ]*?)\\s*$", std::regex::ECMAScript | std::regex::icase)
{
}

std::vector<rcx_string> rcx_result_assembler::split_categories(const rcx_string& raw) const {
  std::vector<rcx_string> categories;
  for (const auto& part : raw.split(",")) {
    rcx_string category = part.trim();
    if (!category.empty()) {
      categories.push_back(category);
    }
  }
  return categories;
}

rcx_payment_mode rcx_result_assembler::classify_payment(const rcx_string& text) const {
  rcx_string lowered = text.to_lower();
  for (const auto& group : payment_keywords) {
    for (const auto& keyword : group.second) {
      if (lowered.contains(keyword)) {
        return group.first;
      }
    }
  }
  return rcx_payment_mode::cash;
}

rcx_string rcx_result_assembler::clean_number_text(const rcx_string& raw) const {
  rcx_string cleaned = cleaner.clean(raw);
  return cleaned.is_numeric() ? cleaned : rcx_string();
}

bool rcx_result_assembler::split_number_unit(const rcx_string& raw, rcx_string& number, rcx_string& unit) const {
  std::smatch match;
  const std::string& text = raw.to_std_const();
  if (!std::regex_match(text, match, quantity_with_unit)) {
    return false;
  }
  rcx_string cleaned = clean_number_text(match[1].str());
  if (cleaned.empty()) {
    return false;
  }
  number = cleaned;
  unit = rcx_string(match[2].str()).trim();
  return true;
}

rcx_receipt_result rcx_result_assembler::assemble(const rcx_extraction_state& state, const std::vector<rcx_fragment>& fragments) const {
  const auto& resolved = state.get_resolved();
  rcx_receipt_result result;

  rcx_datetime date;
  if (dates.parse(raw_field(resolved, field_keys::date), date)) {
    result.date = date;
  }

  // "450 only" keeps the leading number
  rcx_string amount_text = raw_field(resolved, field_keys::amount);
  rcx_string amount_number;
  rcx_string amount_unit;
  if (split_number_unit(amount_text, amount_number, amount_unit)) {
    amount_text = amount_number;
  }
  double amount = 0.0;
  if (cleaner.parse(amount_text, amount)) {
    result.amount = amount;
  }

  result.description = raw_field(resolved, field_keys::description);
  result.categories = split_categories(raw_field(resolved, field_keys::categories));

  if (state.is_resolved(field_keys::mode_of_payment)) {
    result.payment_mode = classify_payment(raw_field(resolved, field_keys::mode_of_payment));
  } else {
    std::vector<rcx_string> texts;
    texts.reserve(fragments.size());
    for (const auto& fragment : fragments) {
      texts.push_back(fragment.text);
    }
    result.payment_mode = classify_payment(rcx_string(" ").join(texts));
  }

  result.item_type = raw_field(resolved, field_keys::item_type);
  result.item = raw_field(resolved, field_keys::item);
  result.brand = raw_field(resolved, field_keys::brand);
  result.spec = raw_field(resolved, field_keys::spec);
  result.unit_of_measure = raw_field(resolved, field_keys::uom);
  rcx_string price_unit;
  rcx_string unit_price = raw_field(resolved, field_keys::unit_price);
  result.unit_price = clean_number_text(unit_price);
  if (result.unit_price.empty() && !unit_price.empty()) {
    split_number_unit(unit_price, result.unit_price, price_unit);
  }

  rcx_string quantity = raw_field(resolved, field_keys::quantity);
  result.quantity = clean_number_text(quantity);
  rcx_string quantity_unit;
  if (result.quantity.empty() && !quantity.empty() &&
      split_number_unit(quantity, result.quantity, quantity_unit)) {
    // "5 bags": number goes to quantity, the word to the unit of measure
    if (result.unit_of_measure.empty()) {
      result.unit_of_measure = quantity_unit;
    }
  }

  result.fields = resolved;
  result.resolutions = state.get_resolutions();
  return result;
}

} // namespace rcx::extract
