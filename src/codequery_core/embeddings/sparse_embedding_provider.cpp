#include "codequery_core/embeddings/sparse_embedding_provider.hpp"

#include <faiss/index_io.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>

extern "C" {
// LAPACK symmetric eigensolver
int dsyev_(const char *jobz, const char *uplo, const int *n, double *a, const int *lda,
           double *w, double *work, const int *lwork, int *info);
}

namespace codequery_core {

std::vector<float> truncated_svd_components(const std::vector<float> &x, int n, int d,
                                            int components) {
  if (components <= 0 || components > d) {
    throw EmbeddingProviderError("Invalid number of SVD components: " +
                                 std::to_string(components));
  }

  // Gram matrix X^T X, symmetric, so row- and column-major layouts coincide
  std::vector<double> gram(static_cast<std::size_t>(d) * d, 0.0);
  for (int row = 0; row < n; ++row) {
    const float *xr = x.data() + static_cast<std::size_t>(row) * d;
    for (int i = 0; i < d; ++i) {
      if (xr[i] == 0.0f) continue;
      for (int j = i; j < d; ++j) {
        gram[static_cast<std::size_t>(i) * d + j] += static_cast<double>(xr[i]) * xr[j];
      }
    }
  }
  for (int i = 0; i < d; ++i) {
    for (int j = 0; j < i; ++j) {
      gram[static_cast<std::size_t>(i) * d + j] = gram[static_cast<std::size_t>(j) * d + i];
    }
  }

  std::vector<double> eigenvalues(d);
  int info = 0;
  int lwork = -1;
  double work_size = 0.0;
  dsyev_("V", "U", &d, gram.data(), &d, eigenvalues.data(), &work_size, &lwork, &info);
  if (info != 0) {
    throw EmbeddingProviderError("LAPACK workspace query failed with code " + std::to_string(info));
  }
  lwork = static_cast<int>(work_size);
  std::vector<double> work(std::max(lwork, 1));
  dsyev_("V", "U", &d, gram.data(), &d, eigenvalues.data(), work.data(), &lwork, &info);
  if (info != 0) {
    throw EmbeddingProviderError("LAPACK eigendecomposition failed with code " +
                                 std::to_string(info));
  }

  // Eigenvalues come back ascending; eigenvector j is column j (contiguous)
  std::vector<float> result(static_cast<std::size_t>(components) * d);
  for (int c = 0; c < components; ++c) {
    const double *vec = gram.data() + static_cast<std::size_t>(d - 1 - c) * d;
    int largest = 0;
    for (int f = 1; f < d; ++f) {
      if (std::fabs(vec[f]) > std::fabs(vec[largest])) largest = f;
    }
    const double sign = vec[largest] < 0.0 ? -1.0 : 1.0;
    for (int f = 0; f < d; ++f) {
      result[static_cast<std::size_t>(c) * d + f] = static_cast<float>(sign * vec[f]);
    }
  }
  return result;
}

SparseEmbeddingProvider::SparseEmbeddingProvider(int dimension, int max_features)
    : dimension_(dimension), vectorizer_(max_features) {
  if (dimension_ <= 0) {
    throw EmbeddingProviderError("Sparse embedding dimension must be greater than 0");
  }
}

SparseEmbeddingProvider::~SparseEmbeddingProvider() = default;

std::string SparseEmbeddingProvider::name() const {
  return NAME;
}

std::string SparseEmbeddingProvider::identity() const {
  return "sparse:tfidf-svd";
}

EmbeddingMatrix SparseEmbeddingProvider::encode_corpus(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }

  std::vector<SparseRow> rows = vectorizer_.fit_transform(texts);
  const int n_samples = static_cast<int>(texts.size());
  const int n_features = vectorizer_.feature_count();

  const int components = std::min({dimension_, n_features, n_samples});
  if (components < dimension_) {
    std::cout << "Adjusting dimensions from " << dimension_ << " to " << components
              << " based on data size" << std::endl;
    dimension_ = components;
  }

  std::vector<float> x = densify(rows);
  std::vector<float> basis = truncated_svd_components(x, n_samples, n_features, dimension_);

  auto projection = std::make_unique<faiss::LinearTransform>(n_features, dimension_, false);
  projection->A = std::move(basis);
  projection->is_trained = true;
  projection_ = std::move(projection);

  return project(rows);
}

EmbeddingMatrix SparseEmbeddingProvider::encode(const std::vector<std::string> &texts) {
  if (!fitted()) {
    throw EmbeddingProviderError("Sparse embeddings requested before the provider was fitted");
  }
  if (texts.empty()) {
    return {};
  }
  return project(vectorizer_.transform(texts));
}

std::vector<float> SparseEmbeddingProvider::densify(const std::vector<SparseRow> &rows) const {
  const std::size_t width = static_cast<std::size_t>(vectorizer_.feature_count());
  std::vector<float> x(rows.size() * width, 0.0f);
  for (std::size_t r = 0; r < rows.size(); ++r) {
    for (const auto &[column, weight] : rows[r]) {
      x[r * width + column] = weight;
    }
  }
  return x;
}

EmbeddingMatrix SparseEmbeddingProvider::project(const std::vector<SparseRow> &rows) const {
  std::vector<float> x = densify(rows);
  std::vector<float> reduced(rows.size() * static_cast<std::size_t>(dimension_));
  projection_->apply_noalloc(static_cast<faiss::idx_t>(rows.size()), x.data(), reduced.data());

  EmbeddingMatrix result;
  result.reserve(rows.size());
  for (std::size_t r = 0; r < rows.size(); ++r) {
    auto begin = reduced.begin() + r * dimension_;
    result.emplace_back(begin, begin + dimension_);
  }
  return result;
}

void SparseEmbeddingProvider::save_state(ChunkArchive &archive) const {
  if (!fitted()) {
    return;
  }
  archive.write_vocabulary(vectorizer_.export_vocabulary());
  try {
    faiss::write_VectorTransform(projection_.get(), archive.projection_path().string().c_str());
  } catch (const std::exception &e) {
    throw EmbeddingProviderError("Failed to write projection: " + std::string(e.what()));
  }
}

void SparseEmbeddingProvider::load_state(ChunkArchive &archive, int expected_dimension) {
  std::vector<VocabularyEntry> entries = archive.read_vocabulary();
  if (entries.empty() || !std::filesystem::exists(archive.projection_path())) {
    throw EmbeddingProviderError("Archive at " + archive.directory().string() +
                                 " has no sparse embedding state");
  }

  std::unique_ptr<faiss::VectorTransform> loaded;
  try {
    loaded.reset(faiss::read_VectorTransform(archive.projection_path().string().c_str()));
  } catch (const std::exception &e) {
    throw EmbeddingProviderError("Failed to read projection: " + std::string(e.what()));
  }

  auto *linear = dynamic_cast<faiss::LinearTransform *>(loaded.get());
  if (!linear || linear->d_in != static_cast<int>(entries.size())) {
    throw EmbeddingProviderError("Stored projection does not match the stored vocabulary");
  }
  if (linear->d_out != expected_dimension) {
    throw EmbeddingProviderError("Stored projection produces " + std::to_string(linear->d_out) +
                                 "-dimensional vectors, index expects " +
                                 std::to_string(expected_dimension));
  }

  vectorizer_.import_vocabulary(entries);
  loaded.release();
  projection_.reset(linear);
  dimension_ = linear->d_out;
}

}  // namespace codequery_core
