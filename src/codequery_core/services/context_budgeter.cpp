#include "codequery_core/services/context_budgeter.hpp"

#include <algorithm>

#include "codequery_core/prompt/prompt_template.hpp"
#include "codequery_core/text_utils.hpp"

namespace codequery_core {

namespace {

constexpr const char *TRUNCATION_MARKER = "...";
// Characters per token assumed for the first truncation cut
constexpr long long CHARS_PER_TOKEN_ESTIMATE = 3;

}  // namespace

ContextBudgeter::ContextBudgeter(std::shared_ptr<const TokenCounter> counter, BudgetPolicy policy)
    : counter_(std::move(counter)), policy_(policy) {
  if (!counter_) {
    throw ContextBudgetError("Context budgeter needs a token counter");
  }
  if (policy_.token_budget <= 0) {
    throw ContextBudgetError("Token budget must be greater than 0");
  }
}

long long ContextBudgeter::cost(const std::string &text) const {
  return static_cast<long long>(counter_->count(text));
}

BudgetedSelection ContextBudgeter::select(const std::string &query,
                                          const std::vector<RetrievalResult> &candidates) const {
  BudgetedSelection selection;
  selection.base_tokens = cost(PromptTemplate::scaffold(query));
  selection.remaining_tokens = static_cast<long long>(policy_.token_budget) -
                               selection.base_tokens - policy_.safety_margin;

  if (candidates.empty()) {
    return selection;
  }

  std::vector<RetrievalResult> ranked = candidates;
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RetrievalResult &a, const RetrievalResult &b) {
                     return a.distance < b.distance;
                   });

  for (const auto &candidate : ranked) {
    const long long c = cost(PromptTemplate::render_chunk(
        selection.chunks.size() + 1, candidate.chunk.filepath, candidate.chunk.content));
    if (selection.used_tokens + c > selection.remaining_tokens) {
      break;
    }
    selection.chunks.push_back(candidate.chunk);
    selection.used_tokens += c;
  }

  if (selection.chunks.empty() && selection.remaining_tokens > policy_.min_truncation_budget) {
    truncate_best(ranked.front().chunk, selection.remaining_tokens, selection);
  }

  // An empty selection is always valid, even when the scaffold alone overruns the budget
  if (!selection.chunks.empty() && selection.used_tokens > selection.remaining_tokens) {
    throw ContextBudgetError("Selected context exceeds the token budget: " +
                             std::to_string(selection.base_tokens) + " + " +
                             std::to_string(policy_.safety_margin) + " + " +
                             std::to_string(selection.used_tokens) + " > " +
                             std::to_string(policy_.token_budget));
  }
  return selection;
}

void ContextBudgeter::truncate_best(const Chunk &best, long long remaining,
                                    BudgetedSelection &selection) const {
  const long long header_tokens = cost(PromptTemplate::render_chunk(1, best.filepath, ""));
  const long long allowance = remaining - header_tokens - cost(TRUNCATION_MARKER);
  if (allowance <= policy_.min_truncated_content_tokens) {
    return;
  }

  const std::size_t total_chars = text::character_count(best.content);
  std::size_t max_chars = static_cast<std::size_t>(allowance * CHARS_PER_TOKEN_ESTIMATE);

  while (max_chars > 0) {
    Chunk truncated = best;
    if (total_chars > max_chars) {
      truncated.content = text::prefix(best.content, max_chars) + TRUNCATION_MARKER;
    }

    const long long c =
        cost(PromptTemplate::render_chunk(1, truncated.filepath, truncated.content));
    if (c <= remaining) {
      selection.chunks.push_back(std::move(truncated));
      selection.used_tokens = c;
      selection.truncated = total_chars > max_chars;
      return;
    }

    if (total_chars < max_chars) {
      max_chars = total_chars;
    } else {
      max_chars -= std::max<std::size_t>(1, max_chars / 10);
    }
  }
}

}  // namespace codequery_core
