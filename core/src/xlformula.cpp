#include "xlformula/xlformula.h"

#include <stdexcept>
#include <utility>

#include "formula_parser.h"
#include "runtime/formula_evaluator.h"
#include "runtime/result_cache.h"
#include "runtime/traversal.h"

namespace xlformula {

struct PreparedFormulaHandle {
  FormulaTree tree;
};

std::shared_ptr<const PreparedFormulaHandle> prepare_formula(const std::string& formula) {
  ParseResult parsed = parse_formula(formula);
  if (!parsed.tree.has_value()) {
    const std::string message = parsed.error.has_value() ? parsed.error->message : "unknown error";
    throw std::runtime_error("Formula parse error: " + message);
  }
  auto prepared = std::make_shared<PreparedFormulaHandle>();
  prepared->tree = std::move(*parsed.tree);
  return prepared;
}

EvaluationResult evaluate_prepared(const std::shared_ptr<const PreparedFormulaHandle>& prepared,
                                   const Row& row) {
  if (!prepared || !prepared->tree.root) {
    throw std::invalid_argument("evaluate_prepared requires a prepared formula");
  }
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  return evaluate_tree(*prepared->tree.root, evaluator);
}

EvaluationResult evaluate_formula(const Row& row, const std::string& formula) {
  return evaluate_prepared(prepare_formula(formula), row);
}

std::vector<EvaluationResult> evaluate_rows(const std::vector<Row>& rows,
                                            const std::string& formula) {
  auto prepared = prepare_formula(formula);
  std::vector<EvaluationResult> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(evaluate_prepared(prepared, row));
  }
  return out;
}

}  // namespace xlformula
