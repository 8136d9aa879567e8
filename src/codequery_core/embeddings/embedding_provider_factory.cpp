#include "codequery_core/embeddings/embedding_provider_factory.hpp"

#include <iostream>

#include "codequery_core/embeddings/dense_embedding_provider.hpp"
#include "codequery_core/embeddings/sparse_embedding_provider.hpp"

namespace codequery_core {

std::unique_ptr<EmbeddingProvider> EmbeddingProviderFactory::create(
    const Config &config, std::shared_ptr<LlmClient> client) {
  switch (config.strategy()) {
    case EmbeddingStrategy::Dense:
      return std::make_unique<DenseEmbeddingProvider>(client, config.embedding_model,
                                                      config.embedding_dimension);
    case EmbeddingStrategy::Sparse:
      return std::make_unique<SparseEmbeddingProvider>(config.sparse_dimension,
                                                       config.sparse_max_features);
    case EmbeddingStrategy::Auto:
      break;
  }

  try {
    return std::make_unique<DenseEmbeddingProvider>(client, config.embedding_model,
                                                    config.embedding_dimension);
  } catch (const EmbeddingProviderError &e) {
    std::cerr << "Warning: dense embeddings unavailable (" << e.what()
              << "), falling back to TF-IDF embeddings" << std::endl;
  }
  return std::make_unique<SparseEmbeddingProvider>(config.sparse_dimension,
                                                   config.sparse_max_features);
}

}  // namespace codequery_core
