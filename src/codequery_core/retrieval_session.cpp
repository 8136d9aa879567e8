#include "codequery_core/retrieval_session.hpp"

#include <algorithm>
#include <iostream>

#include "codequery_core/embeddings/embedding_provider_factory.hpp"

namespace codequery_core {

namespace {

constexpr const char *INFO_PROVIDER = "provider";
constexpr const char *INFO_PROVIDER_IDENTITY = "provider_identity";
constexpr const char *INFO_DOCUMENT_COUNT = "document_count";

BudgetPolicy policy_from(const Config &config) {
  return {.token_budget = config.token_budget,
          .safety_margin = config.safety_margin,
          .min_truncation_budget = config.min_truncation_budget,
          .min_truncated_content_tokens = config.min_truncated_content_tokens};
}

AnswerOptions answer_options_from(const Config &config) {
  return {.generation = {.temperature = config.temperature,
                         .max_tokens = config.max_response_tokens},
          .preview_length = config.preview_length};
}

std::size_t distinct_paths(const std::vector<Chunk> &chunks) {
  std::vector<std::string> paths;
  for (const auto &chunk : chunks) {
    paths.push_back(chunk.filepath);
  }
  std::sort(paths.begin(), paths.end());
  return static_cast<std::size_t>(std::unique(paths.begin(), paths.end()) - paths.begin());
}

}  // namespace

RetrievalSession::RetrievalSession(Config config, std::shared_ptr<LlmClient> llm_client,
                                   std::shared_ptr<const TokenCounter> token_counter)
    : config_(std::move(config)),
      llm_client_(std::move(llm_client)),
      token_counter_(token_counter ? std::move(token_counter)
                                   : std::shared_ptr<const TokenCounter>(
                                         make_token_counter(config_.token_counter))),
      provider_(EmbeddingProviderFactory::create(config_, llm_client_)),
      segmenter_(config_.chunk_size, config_.chunk_overlap) {
  answer_service_ = std::make_unique<AnswerService>(llm_client_, token_counter_,
                                                    policy_from(config_),
                                                    answer_options_from(config_));
  std::cout << "Using " << provider_->name() << " embeddings (" << provider_->identity()
            << ")" << std::endl;
  replace_store(VectorStore());
}

std::size_t RetrievalSession::ingest(const std::vector<Document> &documents) {
  std::vector<Chunk> chunks = segmenter_.chunk_documents(documents);

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.content);
  }

  std::cout << "Generating embeddings for " << chunks.size() << " chunks..." << std::endl;
  EmbeddingMatrix vectors = provider_->encode_corpus(texts);

  VectorStore store;
  store.build(std::move(chunks), vectors);
  const std::size_t indexed = store.count();
  replace_store(std::move(store));
  return indexed;
}

void RetrievalSession::save(const std::filesystem::path &directory) const {
  ChunkArchive archive(directory);
  archive.clear();
  store_->save(archive);
  provider_->save_state(archive);
  archive.write_info(INFO_PROVIDER, provider_->name());
  archive.write_info(INFO_PROVIDER_IDENTITY, provider_->identity());
  archive.write_info(INFO_DOCUMENT_COUNT, std::to_string(distinct_paths(store_->chunks())));
  std::cout << "Saved " << store_->count() << " vectors to " << directory.string() << std::endl;
}

void RetrievalSession::load(const std::filesystem::path &directory) {
  ChunkArchive archive = ChunkArchive::open_existing(directory);

  const auto stored_provider = archive.read_info(INFO_PROVIDER);
  const auto stored_identity = archive.read_info(INFO_PROVIDER_IDENTITY);
  if (!stored_provider || !stored_identity) {
    throw SessionError("Archive at " + directory.string() + " does not name its embedding provider");
  }
  if (*stored_provider != provider_->name() || *stored_identity != provider_->identity()) {
    throw SessionError("Archive at " + directory.string() + " was built with " +
                       *stored_identity + " embeddings, but this session uses " +
                       provider_->identity());
  }

  VectorStore store = VectorStore::load(archive);
  if (!store.empty()) {
    try {
      provider_->load_state(archive, store.dimension());
    } catch (const EmbeddingProviderError &e) {
      throw SessionError("Cannot restore embedding state from " + directory.string() + ": " +
                         e.what());
    }
    if (store.dimension() != provider_->dimension()) {
      throw SessionError("Archive vectors have dimension " + std::to_string(store.dimension()) +
                         ", provider produces " + std::to_string(provider_->dimension()));
    }
  }
  replace_store(std::move(store));
}

std::vector<RetrievalResult> RetrievalSession::search(const std::string &query) {
  return search(query, config_.top_k);
}

std::vector<RetrievalResult> RetrievalSession::search(const std::string &query, int k) {
  return search_service_->search(query, k);
}

AnswerResult RetrievalSession::ask(const std::string &query) {
  return ask(query, config_.top_k);
}

AnswerResult RetrievalSession::ask(const std::string &query, int k) {
  return answer_service_->answer(query, search(query, k));
}

void RetrievalSession::replace_store(VectorStore store) {
  auto next = std::make_shared<const VectorStore>(std::move(store));
  search_service_ = std::make_unique<SearchService>(provider_, next);
  store_ = std::move(next);
}

}  // namespace codequery_core
