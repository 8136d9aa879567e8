#pragma once

#include <memory>
#include <string>
#include <vector>

#include "codequery_core/embeddings/embedding_provider.hpp"
#include "codequery_core/llm/llm_client.hpp"

namespace codequery_core {

// Embeddings from the model service. The service must be reachable at construction
// and must produce vectors of exactly `dimension` components.
class DenseEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr const char *NAME = "dense";

  DenseEmbeddingProvider(std::shared_ptr<LlmClient> client, std::string model_name,
                         int dimension);

  std::string name() const override;
  std::string identity() const override;
  int dimension() const override { return dimension_; }

  EmbeddingMatrix encode_corpus(const std::vector<std::string> &texts) override;
  EmbeddingMatrix encode(const std::vector<std::string> &texts) override;

 private:
  std::shared_ptr<LlmClient> client_;
  std::string model_name_;
  int dimension_;
};

}  // namespace codequery_core
