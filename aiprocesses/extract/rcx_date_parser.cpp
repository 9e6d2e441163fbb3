#include "rcx_date_parser.h"
#include <array>

namespace rcx::extract {

namespace {

const char* const lead = "(?:^|[^0-9])";
const char* const tail = "(?:$|[^0-9])";

std::regex numeric_layout(const std::string& body) {
  return std::regex(lead + body + tail);
}

std::regex named_layout(const std::string& body) {
  return std::regex(body, std::regex::ECMAScript | std::regex::icase);
}

} // namespace

rcx_date_parser::rcx_date_parser() {
  patterns.push_back({"dd/MM/yyyy", numeric_layout("(\\d{1,2})/(\\d{1,2})/(\\d{4})"), component_order::day_month_year, false, false});
  patterns.push_back({"dd-MM-yyyy", numeric_layout("(\\d{1,2})-(\\d{1,2})-(\\d{4})"), component_order::day_month_year, false, false});
  patterns.push_back({"dd.MM.yyyy", numeric_layout("(\\d{1,2})\\.(\\d{1,2})\\.(\\d{4})"), component_order::day_month_year, false, false});
  patterns.push_back({"yyyy-MM-dd", numeric_layout("(\\d{4})-(\\d{1,2})-(\\d{1,2})"), component_order::year_month_day, false, false});
  patterns.push_back({"MM/dd/yyyy", numeric_layout("(\\d{1,2})/(\\d{1,2})/(\\d{4})"), component_order::month_day_year, false, false});
  patterns.push_back({"dd MMM yyyy", named_layout("\\b(\\d{1,2})[ \\-]([a-z]{3})\\.?[ ,\\-]*(\\d{4})\\b"), component_order::day_month_year, true, false});
  patterns.push_back({"dd MMMM yyyy", named_layout("\\b(\\d{1,2})(?:st|nd|rd|th)?\\s+([a-z]{4,9}),?\\s+(\\d{4})\\b"), component_order::day_month_year, true, false});
  patterns.push_back({"MMM dd, yyyy", named_layout("\\b([a-z]{3,9})\\.?\\s+(\\d{1,2})(?:st|nd|rd|th)?,?\\s+(\\d{4})\\b"), component_order::month_day_year, true, false});
  patterns.push_back({"dd/MM/yy", numeric_layout("(\\d{1,2})/(\\d{1,2})/(\\d{2})"), component_order::day_month_year, false, true});
}

int rcx_date_parser::month_from_name(const rcx_string& name) {
  static const std::array<const char*, 12> months = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
  };
  rcx_string lowered = name.to_lower();
  if (lowered.size() < 3) {
    return 0;
  }
  for (size_t i = 0; i < months.size(); ++i) {
    rcx_string full(months[i]);
    // "sept" is the one common four-letter abbreviation
    if (lowered == full || (lowered.size() == 3 && full.starts_with(lowered)) ||
        (lowered == "sept" && i == 8)) {
      return static_cast<int>(i) + 1;
    }
  }
  return 0;
}

bool rcx_date_parser::try_pattern(const pattern& p, const std::string& text, rcx_datetime& out) const {
  std::smatch match;
  if (!std::regex_search(text, match, p.expression)) {
    return false;
  }

  std::string first = match[1].str();
  std::string second = match[2].str();
  std::string third = match[3].str();

  int year = 0;
  int month = 0;
  int day = 0;

  switch (p.order) {
    case component_order::day_month_year:
      day = std::stoi(first);
      month = p.named_month ? month_from_name(second) : std::stoi(second);
      year = std::stoi(third);
      break;
    case component_order::year_month_day:
      year = std::stoi(first);
      month = std::stoi(second);
      day = std::stoi(third);
      break;
    case component_order::month_day_year:
      month = p.named_month ? month_from_name(first) : std::stoi(first);
      day = std::stoi(second);
      year = std::stoi(third);
      break;
  }

  if (p.two_digit_year) {
    year += 2000;
  }

  if (!rcx_datetime::is_valid_date(year, month, day)) {
    return false;
  }

  try {
    out = rcx_datetime(year, month, day);
  } catch (const rcx_datetime_exception&) {
    return false;
  }
  return true;
}

bool rcx_date_parser::parse(const rcx_string& raw, rcx_datetime& out) const {
  std::string text = raw.trim().to_std_const();
  if (text.empty()) {
    return false;
  }
  for (const auto& p : patterns) {
    if (try_pattern(p, text, out)) {
      return true;
    }
  }
  return false;
}

rcx_string rcx_date_parser::matching_pattern(const rcx_string& raw) const {
  std::string text = raw.trim().to_std_const();
  rcx_datetime ignored;
  for (const auto& p : patterns) {
    if (try_pattern(p, text, ignored)) {
      return p.name;
    }
  }
  return rcx_string();
}

} // namespace rcx::extract
