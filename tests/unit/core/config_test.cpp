#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <unistd.h>

#include "codequery_core/config.hpp"

using codequery_core::Config;
using codequery_core::EmbeddingStrategy;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/codequery_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "all-minilm");
  EXPECT_EQ(cfg.completion_model, "llama3.2");
  EXPECT_EQ(cfg.embedding_strategy, "auto");
  EXPECT_EQ(cfg.embedding_dimension, 384);
  EXPECT_EQ(cfg.sparse_dimension, 512);
  EXPECT_EQ(cfg.sparse_max_features, 1000);
  EXPECT_EQ(cfg.chunk_size, 3000);
  EXPECT_EQ(cfg.chunk_overlap, 200);
  EXPECT_EQ(cfg.top_k, 10);
  EXPECT_EQ(cfg.token_budget, 10000);
  EXPECT_EQ(cfg.max_response_tokens, 1024);
  EXPECT_FLOAT_EQ(cfg.temperature, 0.3f);
  EXPECT_EQ(cfg.safety_margin, 200);
  EXPECT_EQ(cfg.min_truncation_budget, 200);
  EXPECT_EQ(cfg.min_truncated_content_tokens, 50);
  EXPECT_EQ(cfg.preview_length, 200);
  EXPECT_EQ(cfg.token_counter, "heuristic");
  EXPECT_EQ(cfg.index_directory, "./data/index");
  EXPECT_EQ(cfg.strategy(), EmbeddingStrategy::Auto);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"ollama_url", "http://models:11434"},
      {"embedding_strategy", "sparse"},
      {"sparse_dimension", 64},
      {"chunk_size", 1000},
      {"chunk_overlap", 100},
      {"token_budget", 4000},
      {"temperature", 0.0}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.ollama_url, "http://models:11434");
  EXPECT_EQ(cfg.strategy(), EmbeddingStrategy::Sparse);
  EXPECT_EQ(cfg.sparse_dimension, 64);
  EXPECT_EQ(cfg.chunk_size, 1000);
  EXPECT_EQ(cfg.chunk_overlap, 100);
  EXPECT_EQ(cfg.token_budget, 4000);
  EXPECT_FLOAT_EQ(cfg.temperature, 0.0f);
}

TEST(ConfigTest, WrongTypedIntegerThrows) {
  EXPECT_THROW(Config::from_json({{"chunk_size", "abc"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"top_k", 2.5}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"token_budget", nullptr}}), std::runtime_error);
}

TEST(ConfigTest, WrongTypedStringOrFloatThrows) {
  EXPECT_THROW(Config::from_json({{"ollama_url", 11434}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"temperature", "warm"}}), std::runtime_error);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "embedding_strategy": "dense",
    "embedding_model": "nomic-embed-text",
    "embedding_dimension": 768,
    "index_directory": "/var/lib/codequery"
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.strategy(), EmbeddingStrategy::Dense);
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.embedding_dimension, 768);
  EXPECT_EQ(cfg.index_directory, "/var/lib/codequery");
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, MalformedJsonThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, OverlapNotSmallerThanChunkSizeThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"chunk_size", 100}, {"chunk_overlap", 100}}); },
               std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"chunk_size", 100}, {"chunk_overlap", 150}}); },
               std::runtime_error);
}

TEST(ConfigTest, UnknownStrategyThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"embedding_strategy", "bm25"}}); }, std::runtime_error);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"ollama_url", ""}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"index_directory", ""}}); }, std::runtime_error);
}

TEST(ConfigTest, NonPositiveSizesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"token_budget", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"top_k", -1}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"sparse_dimension", 0}}); }, std::runtime_error);
}
