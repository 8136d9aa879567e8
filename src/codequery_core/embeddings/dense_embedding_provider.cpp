#include "codequery_core/embeddings/dense_embedding_provider.hpp"

namespace codequery_core {

DenseEmbeddingProvider::DenseEmbeddingProvider(std::shared_ptr<LlmClient> client,
                                               std::string model_name, int dimension)
    : client_(std::move(client)), model_name_(std::move(model_name)), dimension_(dimension) {
  if (!client_) {
    throw EmbeddingProviderError("Dense embeddings need a model service client");
  }
  if (dimension_ <= 0) {
    throw EmbeddingProviderError("Dense embedding dimension must be greater than 0");
  }

  bool available = false;
  try {
    available = client_->is_server_available();
  } catch (const std::exception &e) {
    throw EmbeddingProviderError("Model service check failed: " + std::string(e.what()));
  }
  if (!available) {
    throw EmbeddingProviderError("Model service is not available");
  }

  std::vector<float> probe;
  try {
    probe = client_->get_embedding("dimension probe");
  } catch (const std::exception &e) {
    throw EmbeddingProviderError("Embedding model '" + model_name_ +
                                 "' could not be used: " + e.what());
  }
  if (probe.size() != static_cast<std::size_t>(dimension_)) {
    throw EmbeddingProviderError("Embedding model '" + model_name_ + "' produces " +
                                 std::to_string(probe.size()) + " dimensions, expected " +
                                 std::to_string(dimension_));
  }
}

std::string DenseEmbeddingProvider::name() const {
  return NAME;
}

std::string DenseEmbeddingProvider::identity() const {
  return std::string(NAME) + ":" + model_name_;
}

EmbeddingMatrix DenseEmbeddingProvider::encode_corpus(const std::vector<std::string> &texts) {
  return encode(texts);
}

EmbeddingMatrix DenseEmbeddingProvider::encode(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }

  EmbeddingMatrix vectors;
  try {
    vectors = client_->get_embeddings(texts);
  } catch (const std::exception &e) {
    throw EmbeddingProviderError("Failed to generate embeddings: " + std::string(e.what()));
  }

  if (vectors.size() != texts.size()) {
    throw EmbeddingProviderError("Model service returned " + std::to_string(vectors.size()) +
                                 " embeddings for " + std::to_string(texts.size()) + " texts");
  }
  for (const auto &vector : vectors) {
    if (vector.size() != static_cast<std::size_t>(dimension_)) {
      throw EmbeddingProviderError("Model service returned an embedding of dimension " +
                                   std::to_string(vector.size()) + ", expected " +
                                   std::to_string(dimension_));
    }
  }
  return vectors;
}

}  // namespace codequery_core
