#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codequery_core/llm/llm_client.hpp"

namespace codequery_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaClient : public LlmClient {
 public:
  // Throws OllamaError when no server answers at ollama_url.
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &completion_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  std::string generate(const std::string &prompt, const GenerationOptions &options) override;

  bool is_server_available() override;

  const std::string &embedding_model() const { return embedding_model_; }
  const std::string &completion_model() const { return completion_model_; }

  // Rows of the "embeddings" field of an /api/embed response. A flat array is a
  // single row. Throws OllamaError unless exactly `expected_rows` rows are present.
  static std::vector<std::vector<float>> parse_embeddings(const nlohmann::json &response,
                                                          std::size_t expected_rows);

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string completion_model_;

  // Helper methods
  void setup_server_connection();
};

}  // namespace codequery_core
