#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "codequery_core/prompt/prompt_template.hpp"
#include "codequery_core/services/context_budgeter.hpp"

namespace codequery_core {

using codequery_tests::TestUtilities;

namespace {

const std::string kQuery = "How does the parser report errors?";

// One token per byte keeps the arithmetic in these tests exact
std::shared_ptr<const TokenCounter> byte_counter() {
  return std::make_shared<CallbackTokenCounter>(
      "bytes", [](const std::string& text) { return text.size(); });
}

long long block_cost(std::size_t position, const RetrievalResult& candidate) {
  return static_cast<long long>(
      PromptTemplate::render_chunk(position, candidate.chunk.filepath, candidate.chunk.content)
          .size());
}

long long base_cost() {
  return static_cast<long long>(PromptTemplate::scaffold(kQuery).size());
}

}  // namespace

class ContextBudgeterTest : public ::testing::Test {
 protected:
  // A policy whose chunk allowance (remaining) is exactly `remaining`
  BudgetPolicy policy_for_remaining(long long remaining) const {
    BudgetPolicy policy;
    policy.token_budget = static_cast<int>(base_cost() + policy.safety_margin + remaining);
    return policy;
  }

  void expect_within_budget(const BudgetedSelection& selection, const BudgetPolicy& policy) {
    EXPECT_LE(selection.base_tokens + policy.safety_margin + selection.used_tokens,
              policy.token_budget);
  }
};

TEST_F(ContextBudgeterTest, EmptyCandidatesGiveEmptySelection) {
  BudgetPolicy policy;
  ContextBudgeter budgeter(byte_counter(), policy);

  auto selection = budgeter.select(kQuery, {});

  EXPECT_TRUE(selection.chunks.empty());
  EXPECT_EQ(selection.base_tokens, base_cost());
  EXPECT_EQ(selection.remaining_tokens, policy.token_budget - base_cost() - policy.safety_margin);
  EXPECT_EQ(selection.used_tokens, 0);
  EXPECT_FALSE(selection.truncated);
}

TEST_F(ContextBudgeterTest, GreedyStopTakesTwoBestOfFiveEqualCandidates) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_candidate("c.py", std::string(100, 'c'), 0.3f),
      TestUtilities::create_test_candidate("a.py", std::string(100, 'a'), 0.1f),
      TestUtilities::create_test_candidate("e.py", std::string(100, 'e'), 0.5f),
      TestUtilities::create_test_candidate("b.py", std::string(100, 'b'), 0.2f),
      TestUtilities::create_test_candidate("d.py", std::string(100, 'd'), 0.4f),
  };
  const long long c = block_cost(1, candidates[0]);
  BudgetPolicy policy = policy_for_remaining(2 * c);
  ContextBudgeter budgeter(byte_counter(), policy);

  auto selection = budgeter.select(kQuery, candidates);

  ASSERT_EQ(selection.chunks.size(), 2u);
  EXPECT_EQ(selection.chunks[0].filepath, "a.py");
  EXPECT_EQ(selection.chunks[1].filepath, "b.py");
  EXPECT_EQ(selection.used_tokens, 2 * c);
  EXPECT_FALSE(selection.truncated);
  expect_within_budget(selection, policy);
}

TEST_F(ContextBudgeterTest, StopsAtFirstMisfitEvenIfLaterCandidateFits) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_candidate("small_best.py", std::string(50, 'a'), 0.1f),
      TestUtilities::create_test_candidate("huge.py", std::string(5000, 'b'), 0.2f),
      TestUtilities::create_test_candidate("small_later.py", std::string(50, 'c'), 0.3f),
  };
  const long long remaining =
      block_cost(1, candidates[0]) + block_cost(2, candidates[2]) + 10;
  BudgetPolicy policy = policy_for_remaining(remaining);
  ContextBudgeter budgeter(byte_counter(), policy);

  auto selection = budgeter.select(kQuery, candidates);

  ASSERT_EQ(selection.chunks.size(), 1u);
  EXPECT_EQ(selection.chunks[0].filepath, "small_best.py");
}

TEST_F(ContextBudgeterTest, EqualDistancesKeepInputOrder) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_candidate("first.py", "x", 0.5f),
      TestUtilities::create_test_candidate("second.py", "y", 0.5f),
      TestUtilities::create_test_candidate("best.py", "z", 0.1f),
  };
  ContextBudgeter budgeter(byte_counter(), BudgetPolicy{});

  auto selection = budgeter.select(kQuery, candidates);

  ASSERT_EQ(selection.chunks.size(), 3u);
  EXPECT_EQ(selection.chunks[0].filepath, "best.py");
  EXPECT_EQ(selection.chunks[1].filepath, "first.py");
  EXPECT_EQ(selection.chunks[2].filepath, "second.py");
}

TEST_F(ContextBudgeterTest, TruncatesBestCandidateWhenNothingFits) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_candidate("big.cpp", std::string(5000, 'x'), 0.2f),
      TestUtilities::create_test_candidate("best.cpp", std::string(4000, 'y'), 0.1f),
  };
  BudgetPolicy policy = policy_for_remaining(1000);
  ContextBudgeter budgeter(byte_counter(), policy);

  auto selection = budgeter.select(kQuery, candidates);

  ASSERT_EQ(selection.chunks.size(), 1u);
  EXPECT_TRUE(selection.truncated);
  EXPECT_EQ(selection.chunks[0].filepath, "best.cpp");
  const std::string& content = selection.chunks[0].content;
  ASSERT_GT(content.size(), 3u);
  EXPECT_EQ(content.substr(content.size() - 3), "...");
  EXPECT_EQ(content.substr(0, content.size() - 3),
            std::string(content.size() - 3, 'y'));
  EXPECT_LE(selection.used_tokens, 1000);
  EXPECT_EQ(selection.used_tokens, static_cast<long long>(PromptTemplate::render_chunk(
                                       1, "best.cpp", content).size()));
  expect_within_budget(selection, policy);
}

TEST_F(ContextBudgeterTest, TruncationNeverSplitsUtf8Characters) {
  std::string content;
  for (int i = 0; i < 3000; ++i) {
    content += "\xE2\x82\xAC";  // euro sign, three bytes
  }
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_candidate("euro.txt", content, 0.1f)};
  ContextBudgeter budgeter(byte_counter(), policy_for_remaining(900));

  auto selection = budgeter.select(kQuery, candidates);

  ASSERT_EQ(selection.chunks.size(), 1u);
  const std::string& truncated = selection.chunks[0].content;
  EXPECT_EQ((truncated.size() - 3) % 3, 0u);
  EXPECT_EQ(truncated.substr(0, 3), "\xE2\x82\xAC");
}

TEST_F(ContextBudgeterTest, NoTruncationAtOrBelowMinimumBudget) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_candidate("big.cpp", std::string(5000, 'x'), 0.1f)};
  BudgetPolicy policy = policy_for_remaining(200);
  ContextBudgeter budgeter(byte_counter(), policy);

  auto selection = budgeter.select(kQuery, candidates);

  EXPECT_TRUE(selection.chunks.empty());
  EXPECT_EQ(selection.used_tokens, 0);
}

TEST_F(ContextBudgeterTest, NoTruncationWhenContentAllowanceTooSmall) {
  // Header alone eats most of the remaining budget
  const std::string long_path = "src/" + std::string(180, 'p') + ".cpp";
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_candidate(long_path, std::string(5000, 'x'), 0.1f)};
  const long long header = static_cast<long long>(
      PromptTemplate::render_chunk(1, long_path, "").size());
  BudgetPolicy policy = policy_for_remaining(header + 3 + 50);
  ASSERT_GT(header + 3 + 50, policy.min_truncation_budget);
  ContextBudgeter budgeter(byte_counter(), policy);

  auto selection = budgeter.select(kQuery, candidates);

  EXPECT_TRUE(selection.chunks.empty());
}

TEST_F(ContextBudgeterTest, NegativeRemainingSelectsNothing) {
  BudgetPolicy policy;
  policy.token_budget = 10;
  ContextBudgeter budgeter(byte_counter(), policy);

  BudgetedSelection selection;
  EXPECT_NO_THROW(selection = budgeter.select(
                      kQuery, {TestUtilities::create_test_candidate("a.py", "tiny", 0.1f)}));

  EXPECT_TRUE(selection.chunks.empty());
  EXPECT_EQ(selection.used_tokens, 0);
  EXPECT_LT(selection.remaining_tokens, 0);
}

TEST_F(ContextBudgeterTest, ZeroRemainingSelectsNothingWithoutThrowing) {
  BudgetPolicy policy = policy_for_remaining(0);
  ContextBudgeter budgeter(byte_counter(), policy);

  BudgetedSelection selection;
  EXPECT_NO_THROW(selection = budgeter.select(
                      kQuery, {TestUtilities::create_test_candidate("a.py", "tiny", 0.1f)}));

  EXPECT_TRUE(selection.chunks.empty());
  EXPECT_EQ(selection.remaining_tokens, 0);
  expect_within_budget(selection, policy);
}

TEST_F(ContextBudgeterTest, HeuristicCounterFitsManyDefaultSizedChunks) {
  std::vector<RetrievalResult> candidates;
  for (int i = 0; i < 10; ++i) {
    candidates.push_back(TestUtilities::create_test_candidate(
        "src/file" + std::to_string(i) + ".py", std::string(3000, 'a' + i), 0.1f * i));
  }
  BudgetPolicy policy;
  ContextBudgeter budgeter(std::make_shared<HeuristicTokenCounter>(), policy);

  auto selection = budgeter.select(kQuery, candidates);

  EXPECT_EQ(selection.chunks.size(), 10u);
  expect_within_budget(selection, policy);
}

TEST_F(ContextBudgeterTest, InvalidConstructionThrows) {
  EXPECT_THROW(ContextBudgeter(nullptr, BudgetPolicy{}), ContextBudgetError);
  BudgetPolicy policy;
  policy.token_budget = 0;
  EXPECT_THROW(ContextBudgeter(byte_counter(), policy), ContextBudgetError);
}

}  // namespace codequery_core
