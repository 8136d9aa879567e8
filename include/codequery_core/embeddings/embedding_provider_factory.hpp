#pragma once

#include <memory>

#include "codequery_core/config.hpp"
#include "codequery_core/embeddings/embedding_provider.hpp"
#include "codequery_core/llm/llm_client.hpp"

namespace codequery_core {

class EmbeddingProviderFactory {
 public:
  // Picks the provider once from config.embedding_strategy. "auto" falls back to the
  // sparse provider when the dense one cannot start; "dense" never falls back.
  // `client` may be null, which only the sparse provider tolerates.
  static std::unique_ptr<EmbeddingProvider> create(const Config &config,
                                                   std::shared_ptr<LlmClient> client);
};

}  // namespace codequery_core
