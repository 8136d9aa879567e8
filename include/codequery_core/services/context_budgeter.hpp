#pragma once

#include <memory>
#include <string>
#include <vector>

#include "codequery_core/tokens/token_counter.hpp"
#include "codequery_core/types/chunk.hpp"

namespace codequery_core {

// The prompt came out larger than its costing allowed: counting and rendering disagree.
class ContextBudgetError : public std::exception {
 public:
  explicit ContextBudgetError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct BudgetPolicy {
  // Prompt budget B: model context window minus reserved response tokens
  int token_budget = 10000;
  int safety_margin = 200;
  // Truncation is only attempted when more than this many tokens remain
  int min_truncation_budget = 200;
  // A truncated chunk must keep more than this many tokens of content
  int min_truncated_content_tokens = 50;
};

struct BudgetedSelection {
  std::vector<Chunk> chunks;
  long long base_tokens = 0;
  long long used_tokens = 0;
  // Budget left for chunks before selection; may be negative
  long long remaining_tokens = 0;
  bool truncated = false;
};

/**
 * Chooses which retrieved chunks go into the prompt.
 *
 * Candidates are taken in ascending distance (stable) and accepted while their
 * rendered cost still fits; the first one that does not fit ends the selection, even
 * if a later one would. When nothing fits but a useful amount of room remains, the
 * best candidate is cut down to fit and becomes the only chunk.
 */
class ContextBudgeter {
 public:
  ContextBudgeter(std::shared_ptr<const TokenCounter> counter, BudgetPolicy policy);

  BudgetedSelection select(const std::string &query,
                           const std::vector<RetrievalResult> &candidates) const;

  const BudgetPolicy &policy() const { return policy_; }

 private:
  std::shared_ptr<const TokenCounter> counter_;
  BudgetPolicy policy_;

  long long cost(const std::string &text) const;
  // Appends a cut-down copy of `best` to `selection` when one fits; otherwise leaves it empty.
  void truncate_best(const Chunk &best, long long remaining, BudgetedSelection &selection) const;
};

}  // namespace codequery_core
