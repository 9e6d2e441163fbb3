#include "rcx_receipt_analyzer.h"
#include "rcx_spatial_index.h"
#include <iostream>

namespace rcx::extract {

rcx_receipt_analyzer::rcx_receipt_analyzer(const rcx_extraction_config& config_val, const rcx_field_table& table_val)
  : config(config_val)
  , table(table_val)
  , normalizer(config.confidence_floor)
  , matcher(table)
  , cleaner()
  , dates()
  , resolver(config, cleaner)
  , assembler(cleaner, dates)
{
}

rcx_receipt_result rcx_receipt_analyzer::analyze(const std::vector<rcx_fragment>& fragments) const {
  std::vector<rcx_fragment> usable = normalizer.normalize(fragments);
  if (usable.empty()) {
    throw rcx_parsing_failure("No usable text fragments after normalization", fragments.size());
  }

  rcx_spatial_index index(usable, config.bands_per_unit(), config.row_band);
  rcx_extraction_state state(usable.size());

  for (size_t i = 0; i < usable.size(); ++i) {
    if (state.is_consumed(i)) {
      continue;
    }
    rcx_label_match match;
    if (!matcher.match(usable[i].text, state, match)) {
      continue;
    }
    bool resolved = resolver.resolve(i, match, usable, index, state);
    if (config.verbose && !resolved) {
      std::cerr << "[recture] label '" << usable[i].text.c_str() << "' (" << match.field->key.c_str()
                << ") has no value" << std::endl;
    }
  }

  resolver.sniff_amount(usable, state);

  if (config.verbose) {
    std::cerr << "[recture] " << fragments.size() << " fragments, " << usable.size() << " usable, "
              << index.row_count() << " rows, " << state.get_resolutions().size() << " fields resolved" << std::endl;
    for (const auto& r : state.get_resolutions()) {
      std::cerr << "[recture]   " << r.key.c_str() << " = '" << r.raw_value.c_str() << "' ("
                << resolution_method_name(r.method).c_str() << ")" << std::endl;
    }
  }

  return assembler.assemble(state, usable);
}

} // namespace rcx::extract
