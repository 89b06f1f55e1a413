#pragma once

#include "../lang/ast.h"
#include "formula_evaluator.h"

namespace xlformula {

/// Walks the tree children-before-parents, evaluates every node through the
/// evaluator, and stores each result in the evaluator's cache.
/// Both IF branches are always evaluated; IF only chooses which cached result
/// to return. Returns the root's result.
EvaluationResult evaluate_tree(const FormulaNode& root, FormulaEvaluator& evaluator);

}  // namespace xlformula
