#include "rcx_value_resolver.h"

namespace rcx::extract {

namespace {

const std::string currency = "(?:₹|\\$|€|£|\\b(?:rs\\.?|inr))";
const std::string number = "(\\d[\\d,]*(?:\\.\\d+)?)";
const std::string month_name = "(?:jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)[a-z]*\\.?";

std::regex compile(const std::string& expression) {
  return std::regex(expression, std::regex::ECMAScript | std::regex::icase);
}

} // namespace

rcx_value_resolver::rcx_value_resolver(const rcx_extraction_config& config_val, const rcx_numeric_cleaner& cleaner_val)
  : config(config_val), cleaner(cleaner_val)
{
  // "Qty - 5", "Amount: Rs 1,200"
  numeric_patterns.push_back(compile("[-:]\\s*" + currency + "?\\s*" + number));
  // "Total ₹450"
  numeric_patterns.push_back(compile(currency + "\\s*" + number));
  // "Qty 5", "Qty 5 bags", "Total 450/-"
  numeric_patterns.push_back(compile("^\\s+(" + number + "(?:\\s*/-|\\s*[a-z]+\\.?)?)\\s*$"));

  date_patterns.push_back(compile(
    "(\\d{1,2}[/.\\-]\\d{1,2}[/.\\-]\\d{2,4}"
    "|\\d{4}-\\d{1,2}-\\d{1,2}"
    "|\\d{1,2}(?:st|nd|rd|th)?[ \\-]" + month_name + "[ ,\\-]*\\d{4}"
    "|" + month_name + "\\s+\\d{1,2}(?:st|nd|rd|th)?,?\\s+\\d{4})"));
}

const std::vector<std::regex>& rcx_value_resolver::patterns_for(rcx_value_kind kind) const {
  return kind == rcx_value_kind::date ? date_patterns : numeric_patterns;
}

bool rcx_value_resolver::separated_text(const rcx_string& remainder, rcx_string& value) {
  // "Brand: UltraTech", "Item - Cement"
  size_t pos = remainder.to_std_const().find_first_not_of(" \t");
  if (pos == rcx_string::npos || (remainder[pos] != '-' && remainder[pos] != ':')) {
    return false;
  }
  rcx_string rest = remainder.substr(pos + 1).trim();
  if (rest.empty()) {
    return false;
  }
  value = rest;
  return true;
}

bool rcx_value_resolver::resolve_inline(const rcx_fragment& label, const rcx_label_match& match, rcx_string& value) const {
  if (!match.field || match.alias_end >= label.text.size()) {
    return false;
  }

  if (match.field->kind == rcx_value_kind::text) {
    return separated_text(label.text.substr(match.alias_end), value);
  }

  const std::string remainder = label.text.substr(match.alias_end).to_std_const();
  for (const auto& pattern : patterns_for(match.field->kind)) {
    std::smatch found;
    if (std::regex_search(remainder, found, pattern)) {
      rcx_string captured = rcx_string(found[1].str()).trim();
      if (!captured.empty()) {
        value = captured;
        return true;
      }
    }
  }
  return false;
}

bool rcx_value_resolver::resolve_spatial(size_t label_index, const std::vector<rcx_fragment>& fragments,
                                         const rcx_spatial_index& index, const rcx_extraction_state& state,
                                         size_t& value_index) const {
  if (label_index >= fragments.size()) {
    return false;
  }
  const rcx_fragment& label = fragments[label_index];

  bool found = false;
  double best_gap = 0.0;
  for (size_t candidate : index.neighbors(label_index)) {
    if (state.is_consumed(candidate)) {
      continue;
    }
    const rcx_fragment& fragment = fragments[candidate];
    if (!(fragment.get_left() > label.get_right() - config.right_tolerance)) {
      continue;
    }
    double gap = label.horizontal_gap_to(fragment);
    if (!(gap < config.max_gap)) {
      continue;
    }
    // neighbors() is ascending, so a strict comparison keeps the lower index on ties
    if (!found || gap < best_gap) {
      best_gap = gap;
      value_index = candidate;
      found = true;
    }
  }
  return found;
}

bool rcx_value_resolver::resolve(size_t label_index, const rcx_label_match& match, const std::vector<rcx_fragment>& fragments,
                                 const rcx_spatial_index& index, rcx_extraction_state& state) const {
  if (!match.field || label_index >= fragments.size() || state.is_consumed(label_index)) {
    return false;
  }

  rcx_field_resolution resolution;
  resolution.key = match.field->key;
  resolution.label_index = label_index;

  rcx_string value;
  if (resolve_inline(fragments[label_index], match, value)) {
    resolution.raw_value = value;
    resolution.method = rcx_resolution_method::inline_pattern;
    return state.commit(resolution);
  }

  size_t value_index = rcx_field_resolution::npos;
  if (resolve_spatial(label_index, fragments, index, state, value_index)) {
    resolution.raw_value = fragments[value_index].text.trim();
    resolution.value_index = value_index;
    resolution.method = rcx_resolution_method::spatial;
    return state.commit(resolution);
  }

  return false;
}

bool rcx_value_resolver::sniff_amount(const std::vector<rcx_fragment>& fragments, rcx_extraction_state& state) const {
  if (state.is_resolved(field_keys::amount)) {
    return false;
  }

  for (size_t i = 0; i < fragments.size(); ++i) {
    if (state.is_consumed(i)) {
      continue;
    }
    double value = 0.0;
    if (!cleaner.looks_monetary(fragments[i].text, value)) {
      continue;
    }
    rcx_field_resolution resolution;
    resolution.key = field_keys::amount;
    resolution.raw_value = fragments[i].text.trim();
    resolution.value_index = i;
    resolution.method = rcx_resolution_method::sniffed;
    return state.commit(resolution);
  }
  return false;
}

} // namespace rcx::extract
