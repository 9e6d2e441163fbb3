#ifndef RCX_DATE_PARSER_H
#define RCX_DATE_PARSER_H

#include "../../utils/rcx_datetime.h"
#include <regex>
#include <vector>

namespace rcx::extract {

// Tries a fixed, ordered list of printed date layouts. The first layout that
// yields a valid calendar date wins.
class rcx_date_parser {
public:
  enum class component_order {
    day_month_year,
    year_month_day,
    month_day_year
  };

  struct pattern {
    rcx_string name;
    std::regex expression;
    component_order order;
    bool named_month;
    bool two_digit_year;
  };

private:
  std::vector<pattern> patterns;

  static int month_from_name(const rcx_string& name);
  bool try_pattern(const pattern& p, const std::string& text, rcx_datetime& out) const;

public:
  rcx_date_parser();

  // Never throws; false leaves out untouched.
  bool parse(const rcx_string& raw, rcx_datetime& out) const;

  // Layout name of the first pattern that accepts raw, empty when none does.
  rcx_string matching_pattern(const rcx_string& raw) const;

  const std::vector<pattern>& get_patterns() const { return patterns; }
};

} // namespace rcx::extract

#endif // RCX_DATE_PARSER_H
