#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "codequery_core/config.hpp"
#include "codequery_core/embeddings/embedding_provider.hpp"
#include "codequery_core/llm/llm_client.hpp"
#include "codequery_core/segmenter.hpp"
#include "codequery_core/services/answer_service.hpp"
#include "codequery_core/services/search_service.hpp"
#include "codequery_core/tokens/token_counter.hpp"
#include "codequery_core/types.hpp"
#include "codequery_core/vector_store.hpp"

namespace codequery_core {

class SessionError : public std::exception {
 public:
  explicit SessionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * One index and the provider that built it, plus everything needed to query it.
 *
 * The embedding provider is chosen once, at construction. ingest() and load() each
 * build a complete new index and only then replace the current one, so a failure
 * leaves the previous index in place.
 */
class RetrievalSession {
 public:
  // `llm_client` may be null: embeddings then come from the sparse provider (unless the
  // config demands dense) and answers report that no model service is configured.
  // A null `token_counter` selects config.token_counter.
  RetrievalSession(Config config, std::shared_ptr<LlmClient> llm_client,
                   std::shared_ptr<const TokenCounter> token_counter = nullptr);

  // Returns the number of chunks indexed.
  std::size_t ingest(const std::vector<Document> &documents);

  void save(const std::filesystem::path &directory) const;
  // Throws SessionError when the archive was built by a different embedding provider or
  // its provider state does not match its vectors; the current index is kept.
  void load(const std::filesystem::path &directory);

  std::vector<RetrievalResult> search(const std::string &query);
  std::vector<RetrievalResult> search(const std::string &query, int k);

  AnswerResult ask(const std::string &query);
  AnswerResult ask(const std::string &query, int k);

  const Config &config() const { return config_; }
  const EmbeddingProvider &provider() const { return *provider_; }
  const VectorStore &store() const { return *store_; }

 private:
  Config config_;
  std::shared_ptr<LlmClient> llm_client_;
  std::shared_ptr<const TokenCounter> token_counter_;
  std::shared_ptr<EmbeddingProvider> provider_;
  Segmenter segmenter_;
  std::shared_ptr<const VectorStore> store_;
  std::unique_ptr<SearchService> search_service_;
  std::unique_ptr<AnswerService> answer_service_;

  void replace_store(VectorStore store);
};

}  // namespace codequery_core
