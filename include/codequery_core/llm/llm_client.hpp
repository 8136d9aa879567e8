#pragma once

#include <string>
#include <vector>

namespace codequery_core {

struct GenerationOptions {
  float temperature = 0.3f;
  int max_tokens = 1024;
};

// Boundary to the model service: text embeddings and single-shot text completion.
// Every call blocks until the service answers or fails.
class LlmClient {
 public:
  virtual ~LlmClient() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) = 0;

  virtual std::string generate(const std::string &prompt, const GenerationOptions &options) = 0;

  virtual bool is_server_available() = 0;
};

}  // namespace codequery_core
