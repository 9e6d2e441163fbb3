#ifndef RCX_RECEIPT_ANALYZER_H
#define RCX_RECEIPT_ANALYZER_H

#include "rcx_analysis_exceptions.h"
#include "rcx_date_parser.h"
#include "rcx_extraction_config.h"
#include "rcx_field_matcher.h"
#include "rcx_numeric_cleaner.h"
#include "rcx_receipt_result.h"
#include "rcx_result_assembler.h"
#include "rcx_text_normalizer.h"
#include "rcx_value_resolver.h"

namespace rcx::extract {

// The field-extraction engine. Construct once and share: configuration, field
// table and compiled patterns are immutable after construction, and every
// analyze() call keeps its mutable state on its own stack.
class rcx_receipt_analyzer {
  rcx_extraction_config config;
  const rcx_field_table& table;
  rcx_text_normalizer normalizer;
  rcx_field_matcher matcher;
  rcx_numeric_cleaner cleaner;
  rcx_date_parser dates;
  rcx_value_resolver resolver;
  rcx_result_assembler assembler;

public:
  explicit rcx_receipt_analyzer(const rcx_extraction_config& config = rcx_extraction_config::defaults(),
                                const rcx_field_table& table = rcx_field_table::standard());

  rcx_receipt_analyzer(const rcx_receipt_analyzer&) = delete;
  rcx_receipt_analyzer& operator=(const rcx_receipt_analyzer&) = delete;

  // Throws rcx_parsing_failure when no fragment survives normalization. Missing
  // or malformed fields never raise.
  rcx_receipt_result analyze(const std::vector<rcx_fragment>& fragments) const;

  const rcx_extraction_config& get_config() const { return config; }
  const rcx_field_table& get_table() const { return table; }
};

} // namespace rcx::extract

#endif // RCX_RECEIPT_ANALYZER_H
