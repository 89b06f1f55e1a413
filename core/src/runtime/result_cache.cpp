#include "result_cache.h"

#include <stdexcept>
#include <utility>

namespace xlformula {

const EvaluationResult& ResultCache::get(const FormulaNode* node) const {
  auto it = results_.find(node);
  if (it == results_.end()) {
    throw std::logic_error("Result requested for a node that has not been evaluated");
  }
  return it->second;
}

void ResultCache::set(const FormulaNode* node, EvaluationResult result) {
  auto inserted = results_.emplace(node, std::move(result));
  if (!inserted.second) {
    throw std::logic_error("Node result written twice in one evaluation");
  }
  order_.push_back(node);
}

bool ResultCache::contains(const FormulaNode* node) const {
  return results_.find(node) != results_.end();
}

std::vector<EvaluationResult> ResultCache::values() const {
  std::vector<EvaluationResult> out;
  out.reserve(order_.size());
  for (const FormulaNode* node : order_) {
    out.push_back(results_.at(node));
  }
  return out;
}

}  // namespace xlformula
