#pragma once

#include <memory>
#include <string>
#include <vector>

#include "codequery_core/embeddings/embedding_provider.hpp"
#include "codequery_core/types/chunk.hpp"
#include "codequery_core/vector_store.hpp"

namespace codequery_core {

class SearchServiceException : public std::exception {
 public:
  explicit SearchServiceException(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class SearchService {
 public:
  // `provider` must be the provider whose vectors built `store`.
  SearchService(std::shared_ptr<EmbeddingProvider> provider,
                std::shared_ptr<const VectorStore> store);

  // Natural-language semantic search. Returns top-k nearest chunks, closest first.
  std::vector<RetrievalResult> search(const std::string &query, int k = 10);

 private:
  std::vector<float> embed_query(const std::string &query);
  std::shared_ptr<EmbeddingProvider> provider_;
  std::shared_ptr<const VectorStore> store_;
};

}  // namespace codequery_core
