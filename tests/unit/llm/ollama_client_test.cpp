#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "codequery_core/llm/ollama_client.hpp"

namespace codequery_core {

using json = nlohmann::json;

TEST(OllamaClientParseTest, ReadsEveryRowOfABatch) {
  json response = {{"model", "all-minilm"},
                   {"embeddings", {{0.1, 0.2, 0.3}, {0.4, 0.5, 0.6}, {0.7, 0.8, 0.9}}}};

  auto rows = OllamaClient::parse_embeddings(response, 3);

  ASSERT_EQ(rows.size(), 3u);
  EXPECT_FLOAT_EQ(rows[0][0], 0.1f);
  EXPECT_FLOAT_EQ(rows[1][1], 0.5f);
  EXPECT_FLOAT_EQ(rows[2][2], 0.9f);
}

TEST(OllamaClientParseTest, FlatArrayIsASingleRow) {
  json response = {{"embeddings", {1.0, 2.0}}};

  auto rows = OllamaClient::parse_embeddings(response, 1);

  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].size(), 2u);
}

TEST(OllamaClientParseTest, RowCountMismatchThrows) {
  json response = {{"embeddings", {{0.1, 0.2}, {0.3, 0.4}}}};
  EXPECT_THROW(OllamaClient::parse_embeddings(response, 3), OllamaError);
}

TEST(OllamaClientParseTest, MissingOrMalformedEmbeddingsThrow) {
  EXPECT_THROW(OllamaClient::parse_embeddings(json{{"model", "x"}}, 1), OllamaError);
  EXPECT_THROW(OllamaClient::parse_embeddings(json{{"embeddings", "none"}}, 1), OllamaError);
  EXPECT_THROW(OllamaClient::parse_embeddings(json{{"embeddings", {{"a", "b"}}}}, 1),
               OllamaError);
}

}  // namespace codequery_core
