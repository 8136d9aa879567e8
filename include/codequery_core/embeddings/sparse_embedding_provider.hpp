#pragma once

#include <faiss/VectorTransform.h>

#include <memory>
#include <string>
#include <vector>

#include "codequery_core/embeddings/embedding_provider.hpp"
#include "codequery_core/embeddings/tfidf_vectorizer.hpp"

namespace codequery_core {

/**
 * Local, model-free embeddings: TF-IDF rows reduced to `dimension` components by a
 * truncated SVD learned from the corpus. The reduction is kept as a faiss
 * LinearTransform so it can be written beside the index.
 *
 * The corpus may not support the requested dimension. encode_corpus() then lowers
 * the dimension to min(dimension, vocabulary size, corpus size) and keeps it.
 */
class SparseEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr const char *NAME = "sparse";

  SparseEmbeddingProvider(int dimension, int max_features);
  ~SparseEmbeddingProvider() override;

  std::string name() const override;
  std::string identity() const override;
  int dimension() const override { return dimension_; }

  EmbeddingMatrix encode_corpus(const std::vector<std::string> &texts) override;
  EmbeddingMatrix encode(const std::vector<std::string> &texts) override;

  void save_state(ChunkArchive &archive) const override;
  void load_state(ChunkArchive &archive, int expected_dimension) override;

  bool fitted() const { return projection_ != nullptr; }

 private:
  int dimension_;
  TfidfVectorizer vectorizer_;
  std::unique_ptr<faiss::LinearTransform> projection_;

  std::vector<float> densify(const std::vector<SparseRow> &rows) const;
  EmbeddingMatrix project(const std::vector<SparseRow> &rows) const;
};

// Top `components` right singular vectors of the row-major n x d matrix `x`,
// as a components x d row-major matrix. Signs are fixed so that the largest
// absolute entry of each vector is positive.
std::vector<float> truncated_svd_components(const std::vector<float> &x, int n, int d,
                                            int components);

}  // namespace codequery_core
