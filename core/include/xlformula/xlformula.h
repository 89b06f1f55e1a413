#pragma once

#include <memory>
#include <string>
#include <vector>

#include "xlformula/value.h"

namespace xlformula {

struct PreparedFormulaHandle;

/// Parses a formula once so it can be evaluated against many rows.
/// MUST throw std::runtime_error ("Formula parse error: ...") on malformed text.
/// The handle is immutable and safe to share between threads.
std::shared_ptr<const PreparedFormulaHandle> prepare_formula(const std::string& formula);
/// Evaluates a prepared formula against one row with a fresh result cache.
/// MUST NOT throw for formula-level failures; those come back as error results.
EvaluationResult evaluate_prepared(const std::shared_ptr<const PreparedFormulaHandle>& prepared,
                                   const Row& row);
/// Parses and evaluates a formula against one row.
/// Inputs are the row/formula; parse failures throw, evaluation failures are data.
EvaluationResult evaluate_formula(const Row& row, const std::string& formula);
/// Parses once and evaluates each row independently, in row order.
std::vector<EvaluationResult> evaluate_rows(const std::vector<Row>& rows,
                                            const std::string& formula);

}  // namespace xlformula
