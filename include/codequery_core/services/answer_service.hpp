#pragma once

#include <memory>
#include <string>
#include <vector>

#include "codequery_core/llm/llm_client.hpp"
#include "codequery_core/services/context_budgeter.hpp"
#include "codequery_core/tokens/token_counter.hpp"
#include "codequery_core/types/answer.hpp"
#include "codequery_core/types/chunk.hpp"

namespace codequery_core {

struct AnswerOptions {
  GenerationOptions generation;
  // Characters of chunk content shown with each citation
  int preview_length = 200;
};

class AnswerService {
 public:
  // `llm_client` may be null; answers then carry an error message instead of model output.
  AnswerService(std::shared_ptr<LlmClient> llm_client,
                std::shared_ptr<const TokenCounter> token_counter, BudgetPolicy policy,
                AnswerOptions options = {});

  // Budgets the retrieved chunks into a prompt and asks the model. Generation failures
  // become the answer text; a prompt over budget throws ContextBudgetError.
  AnswerResult answer(const std::string &query, const std::vector<RetrievalResult> &retrieved);

  // The prompt answer() would send, after budgeting and the final size check.
  std::string build_prompt(const std::string &query, const BudgetedSelection &selection) const;

  const ContextBudgeter &budgeter() const { return budgeter_; }

 private:
  std::shared_ptr<LlmClient> llm_client_;
  std::shared_ptr<const TokenCounter> token_counter_;
  ContextBudgeter budgeter_;
  AnswerOptions options_;

  std::string generate(const std::string &prompt);
  std::vector<Citation> cite(const std::vector<RetrievalResult> &retrieved,
                             const std::vector<Chunk> &accepted) const;
};

}  // namespace codequery_core
