#include "codequery_core/services/search_service.hpp"

namespace codequery_core {

SearchService::SearchService(std::shared_ptr<EmbeddingProvider> provider,
                             std::shared_ptr<const VectorStore> store)
    : provider_(std::move(provider)), store_(std::move(store)) {
  if (!provider_ || !store_) {
    throw SearchServiceException("Search needs an embedding provider and a vector store");
  }
}

std::vector<RetrievalResult> SearchService::search(const std::string &query, int k) {
  // Nothing indexed: an empty answer, not an error
  if (store_->empty() || k <= 0) {
    return {};
  }

  try {
    std::vector<float> query_embedding = embed_query(query);
    std::vector<SearchHit> hits = store_->search(query_embedding, k);

    std::vector<RetrievalResult> results;
    results.reserve(hits.size());
    for (const auto &hit : hits) {
      results.push_back({store_->chunk_at(hit.position), hit.distance});
    }
    return results;
  } catch (const std::exception &e) {
    // Re-throw as SearchServiceException to maintain the expected interface
    throw SearchServiceException("Search failed: " + std::string(e.what()));
  }
}

std::vector<float> SearchService::embed_query(const std::string &query) {
  EmbeddingMatrix vectors = provider_->encode({query});
  if (vectors.size() != 1) {
    throw SearchServiceException("Embedding provider returned no vector for the query");
  }
  return std::move(vectors.front());
}

}  // namespace codequery_core
