#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "../lang/ast.h"
#include "xlformula/value.h"

namespace xlformula {

/// Per-evaluation memo of node results keyed by node identity.
/// MUST live for exactly one evaluation pass and MUST NOT be shared between
/// concurrent evaluations.
class ResultCache {
 public:
  /// Returns the stored result for an evaluated node.
  /// Throws std::logic_error when the node has not been evaluated yet; the
  /// post-order driver guarantees this never happens for well-formed trees.
  const EvaluationResult& get(const FormulaNode* node) const;
  /// Stores the result for a node. Throws std::logic_error on a second write.
  void set(const FormulaNode* node, EvaluationResult result);
  bool contains(const FormulaNode* node) const;
  size_t size() const { return order_.size(); }
  /// Returns every stored result in insertion order.
  std::vector<EvaluationResult> values() const;
  /// Returns the result of the traversal's designated root node.
  const EvaluationResult& result_for(const FormulaNode* root) const { return get(root); }

 private:
  std::unordered_map<const FormulaNode*, EvaluationResult> results_;
  std::vector<const FormulaNode*> order_;
};

}  // namespace xlformula
