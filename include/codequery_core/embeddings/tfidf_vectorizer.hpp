#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "codequery_core/db/chunk_archive.hpp"

namespace codequery_core {

// (column, weight) pairs in ascending column order
using SparseRow = std::vector<std::pair<int, float>>;

/**
 * Term-frequency / inverse-document-frequency weighting over a bounded vocabulary.
 *
 * Tokens are lower-cased runs of two or more word characters (ASCII alphanumerics,
 * underscore, or any non-ASCII byte); English stop words are dropped. The vocabulary
 * keeps the max_features terms with the highest corpus frequency and orders its
 * columns alphabetically. IDF is smoothed, ln((1 + n) / (1 + df)) + 1, and every row
 * is scaled to unit L2 norm.
 */
class TfidfVectorizer {
 public:
  explicit TfidfVectorizer(int max_features);

  // Learns vocabulary and idf from `texts`, then transforms them.
  std::vector<SparseRow> fit_transform(const std::vector<std::string> &texts);
  // Terms outside the fitted vocabulary are ignored; an all-unknown text maps to an empty row.
  std::vector<SparseRow> transform(const std::vector<std::string> &texts) const;

  bool fitted() const { return !vocabulary_.empty(); }
  int feature_count() const { return static_cast<int>(terms_.size()); }
  int max_features() const { return max_features_; }

  std::vector<VocabularyEntry> export_vocabulary() const;
  // Restores a vocabulary written by export_vocabulary(). Columns must be 0..n-1.
  void import_vocabulary(const std::vector<VocabularyEntry> &entries);

  static std::vector<std::string> tokenize(const std::string &text);
  static bool is_stop_word(const std::string &token);

 private:
  int max_features_;
  std::vector<std::string> terms_;
  std::vector<float> idf_;
  std::unordered_map<std::string, int> vocabulary_;

  SparseRow transform_one(const std::string &text) const;
};

}  // namespace codequery_core
