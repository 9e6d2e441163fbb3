#include "rcx_field_table.h"
#include <set>
#include <stdexcept>

namespace rcx::extract {

namespace field_keys {
  const char* const date = "date";
  const char* const amount = "amount";
  const char* const categories = "categories";
  const char* const mode_of_payment = "modeOfPayment";
  const char* const description = "description";
  const char* const item_type = "itemType";
  const char* const item = "item";
  const char* const brand = "brand";
  const char* const spec = "spec";
  const char* const quantity = "quantity";
  const char* const unit_price = "unitPrice";
  const char* const uom = "uom";
}

rcx_field_table::rcx_field_table(const rcx_string& version_val, std::vector<rcx_field_definition> definitions_val)
  : version(version_val), definitions(std::move(definitions_val))
{
  std::set<rcx_string> keys;
  for (auto& def : definitions) {
    if (def.key.empty() || def.aliases.empty()) {
      throw std::invalid_argument("Field definition needs a key and at least one alias");
    }
    if (!keys.insert(def.key).second) {
      throw std::invalid_argument(std::string("Duplicate field key: ") + def.key.c_str());
    }
    for (auto& alias : def.aliases) {
      alias = alias.to_lower().trim();
    }
  }
}

const rcx_field_table& rcx_field_table::standard() {
  // itemType sits before item/categories and unitPrice before uom so that
  // "Item Type", "Sub Category" and "Unit Price" reach the specific field.
  static const rcx_field_table table("2025.12-2", {
    {field_keys::date, {"date", "expense date", "bill date", "invoice date"}, rcx_value_kind::date},
    {field_keys::amount, {"total amount", "amount paid", "grand total", "amount", "total", "net payable"}, rcx_value_kind::numeric},
    {"projectId", {"project id", "project code", "project"}, rcx_value_kind::text},
    {"department", {"department", "dept", "division"}, rcx_value_kind::text},
    {"phaseId", {"phase id", "phase code"}, rcx_value_kind::text},
    {"phaseName", {"phase name", "phase"}, rcx_value_kind::text},
    {field_keys::item_type, {"item type", "sub category"}, rcx_value_kind::text},
    {field_keys::categories, {"category", "categories", "expense type"}, rcx_value_kind::text},
    {field_keys::mode_of_payment, {"mode of payment", "payment mode", "paid via", "payment"}, rcx_value_kind::text},
    {field_keys::description, {"description", "details", "remarks", "purpose"}, rcx_value_kind::text},
    {field_keys::item, {"item", "material"}, rcx_value_kind::text},
    {field_keys::brand, {"brand", "make"}, rcx_value_kind::text},
    {field_keys::spec, {"specification", "spec", "grade"}, rcx_value_kind::text},
    {"thickness", {"thickness", "size"}, rcx_value_kind::text},
    {field_keys::quantity, {"quantity", "qty"}, rcx_value_kind::numeric},
    {field_keys::unit_price, {"unit price", "unitprice", "price per unit", "rate"}, rcx_value_kind::numeric},
    {field_keys::uom, {"unit of measure", "uom", "unit"}, rcx_value_kind::text},
    {"submittedBy", {"submitted by", "employee", "phone", "mobile"}, rcx_value_kind::text},
  });
  return table;
}

const rcx_field_definition* rcx_field_table::find(const rcx_string& key) const {
  for (const auto& def : definitions) {
    if (def.key == key) {
      return &def;
    }
  }
  return nullptr;
}

} // namespace rcx::extract
