#include "codequery_core/services/answer_service.hpp"

#include <algorithm>
#include <unordered_set>

#include "codequery_core/prompt/prompt_template.hpp"
#include "codequery_core/text_utils.hpp"

namespace codequery_core {

AnswerService::AnswerService(std::shared_ptr<LlmClient> llm_client,
                             std::shared_ptr<const TokenCounter> token_counter,
                             BudgetPolicy policy, AnswerOptions options)
    : llm_client_(std::move(llm_client)),
      token_counter_(token_counter),
      budgeter_(token_counter, policy),
      options_(options) {}

AnswerResult AnswerService::answer(const std::string &query,
                                   const std::vector<RetrievalResult> &retrieved) {
  BudgetedSelection selection = budgeter_.select(query, retrieved);
  std::string prompt = build_prompt(query, selection);

  AnswerResult result;
  result.answer = generate(prompt);
  result.sources = cite(retrieved, selection.chunks);
  result.chunks_used = selection.chunks.size();
  result.chunks_retrieved = retrieved.size();
  return result;
}

std::string AnswerService::build_prompt(const std::string &query,
                                        const BudgetedSelection &selection) const {
  std::string prompt = PromptTemplate::render_prompt(query, selection.chunks);

  const std::size_t prompt_tokens = token_counter_->count(prompt);
  const auto budget = static_cast<std::size_t>(budgeter_.policy().token_budget);
  if (prompt_tokens > budget) {
    throw ContextBudgetError("Prompt exceeds token limit: " + std::to_string(prompt_tokens) +
                             " > " + std::to_string(budget));
  }
  return prompt;
}

std::string AnswerService::generate(const std::string &prompt) {
  if (!llm_client_) {
    return "Error generating answer: no model service is configured";
  }
  try {
    return llm_client_->generate(prompt, options_.generation);
  } catch (const std::exception &e) {
    return "Error generating answer: " + std::string(e.what());
  }
}

std::vector<Citation> AnswerService::cite(const std::vector<RetrievalResult> &retrieved,
                                          const std::vector<Chunk> &accepted) const {
  std::unordered_set<std::string> accepted_paths;
  for (const auto &chunk : accepted) {
    accepted_paths.insert(chunk.filepath);
  }

  std::vector<RetrievalResult> ranked = retrieved;
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RetrievalResult &a, const RetrievalResult &b) {
                     return a.distance < b.distance;
                   });

  // One citation per path, from that path's most relevant chunk
  std::vector<Citation> citations;
  std::unordered_set<std::string> cited;
  for (const auto &result : ranked) {
    const std::string &path = result.chunk.filepath;
    if (accepted_paths.count(path) == 0 || !cited.insert(path).second) {
      continue;
    }
    citations.push_back(
        {path, result.distance,
         text::prefix(result.chunk.content, static_cast<std::size_t>(options_.preview_length)) +
             "..."});
  }
  return citations;
}

}  // namespace codequery_core
