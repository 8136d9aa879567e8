#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "codequery_core/types/embedding_strategy.hpp"

namespace codequery_core {

class Config {
 public:
  // Model service
  std::string ollama_url;
  std::string embedding_model;
  std::string completion_model;

  // Embeddings
  std::string embedding_strategy;
  int embedding_dimension;
  int sparse_dimension;
  int sparse_max_features;

  // Segmentation and retrieval
  int chunk_size;
  int chunk_overlap;
  int top_k;

  // Prompt budgeting and generation
  int token_budget;
  int max_response_tokens;
  float temperature;
  int safety_margin;
  int min_truncation_budget;
  int min_truncated_content_tokens;
  int preview_length;
  std::string token_counter;

  std::string index_directory;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    try {
      return parse(json_config);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }
  }

  EmbeddingStrategy strategy() const {
    return embedding_strategy_from_string(embedding_strategy);
  }

 private:
  static Config parse(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
    config.completion_model = json_config.value("completion_model", std::string("llama3.2"));

    config.embedding_strategy = json_config.value("embedding_strategy", std::string("auto"));
    config.embedding_dimension = read_int(json_config, "embedding_dimension", 384);
    config.sparse_dimension = read_int(json_config, "sparse_dimension", 512);
    config.sparse_max_features = read_int(json_config, "sparse_max_features", 1000);

    config.chunk_size = read_int(json_config, "chunk_size", 3000);
    config.chunk_overlap = read_int(json_config, "chunk_overlap", 200);
    config.top_k = read_int(json_config, "top_k", 10);

    config.token_budget = read_int(json_config, "token_budget", 10000);
    config.max_response_tokens = read_int(json_config, "max_response_tokens", 1024);
    config.temperature = json_config.value("temperature", 0.3f);
    config.safety_margin = read_int(json_config, "safety_margin", 200);
    config.min_truncation_budget = read_int(json_config, "min_truncation_budget", 200);
    config.min_truncated_content_tokens = read_int(json_config, "min_truncated_content_tokens", 50);
    config.preview_length = read_int(json_config, "preview_length", 200);
    config.token_counter = json_config.value("token_counter", std::string("heuristic"));

    config.index_directory = json_config.value("index_directory", std::string("./data/index"));

    config.validate();
    return config;
  }

  // Missing keys take the default; present keys must hold an integer
  static int read_int(const nlohmann::json& json_config, const char* key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const nlohmann::json& value = json_config.at(key);
    if (!value.is_number_integer()) {
      throw std::runtime_error(std::string(key) + " must be an integer, got " + value.dump());
    }
    return value.get<int>();
  }

  void validate() const {
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (completion_model.empty()) {
      throw std::runtime_error("completion_model cannot be empty");
    }
    if (embedding_strategy != "auto" && embedding_strategy != "dense" &&
        embedding_strategy != "sparse") {
      throw std::runtime_error("embedding_strategy must be one of auto, dense, sparse");
    }
    if (embedding_dimension <= 0 || sparse_dimension <= 0) {
      throw std::runtime_error("embedding dimensions must be greater than 0");
    }
    if (sparse_max_features <= 0) {
      throw std::runtime_error("sparse_max_features must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (token_budget <= 0) {
      throw std::runtime_error("token_budget must be greater than 0");
    }
    if (max_response_tokens <= 0) {
      throw std::runtime_error("max_response_tokens must be greater than 0");
    }
    if (temperature < 0.0f) {
      throw std::runtime_error("temperature cannot be negative");
    }
    if (safety_margin < 0 || min_truncation_budget < 0 || min_truncated_content_tokens < 0) {
      throw std::runtime_error("budget thresholds cannot be negative");
    }
    if (preview_length <= 0) {
      throw std::runtime_error("preview_length must be greater than 0");
    }
    if (token_counter.empty()) {
      throw std::runtime_error("token_counter cannot be empty");
    }
    if (index_directory.empty()) {
      throw std::runtime_error("index_directory cannot be empty");
    }
  }
};

}  // namespace codequery_core
