#include "traversal.h"

#include <vector>

namespace xlformula {

namespace {

EvaluationResult evaluate_node(const FormulaNode& node, const FormulaEvaluator& evaluator) {
  const ResultCache& cache = evaluator.cache();
  switch (node.kind) {
    case FormulaNode::Kind::Literal:
      return make_ok(from_cell(node.literal));
    case FormulaNode::Kind::CellRef:
      return evaluator.resolve_column_value(node.ref);
    case FormulaNode::Kind::RangeRef:
      return evaluator.resolve_range(node.ref, node.range_end_ref);
    case FormulaNode::Kind::Unary:
      return evaluator.eval_unary(node.op, cache.get(node.children[0].get()));
    case FormulaNode::Kind::Binary:
      return evaluator.eval_binary(node.op,
                                   cache.get(node.children[0].get()),
                                   cache.get(node.children[1].get()));
    case FormulaNode::Kind::Comparison:
      return evaluator.eval_comparison(node.op,
                                       cache.get(node.children[0].get()),
                                       cache.get(node.children[1].get()));
    case FormulaNode::Kind::FunctionCall: {
      std::vector<const FormulaNode*> args;
      args.reserve(node.children.size());
      for (const auto& child : node.children) {
        args.push_back(child.get());
      }
      return evaluator.eval_function(node.function_name, args);
    }
  }
  return make_error(FormulaError::Kind::Unimplemented, "not implemented");
}

void visit(const FormulaNode& node, FormulaEvaluator& evaluator) {
  for (const auto& child : node.children) {
    visit(*child, evaluator);
  }
  evaluator.cache().set(&node, evaluate_node(node, evaluator));
}

}  // namespace

EvaluationResult evaluate_tree(const FormulaNode& root, FormulaEvaluator& evaluator) {
  visit(root, evaluator);
  return evaluator.cache().result_for(&root);
}

}  // namespace xlformula
