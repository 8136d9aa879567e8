#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "codequery_core/types/chunk.hpp"
#include "codequery_core/types/document.hpp"

namespace codequery_core {

class SegmenterError : public std::exception {
 public:
  explicit SegmenterError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Splits document text into overlapping windows of at most chunk_size characters.
class Segmenter {
 public:
  // Throws SegmenterError unless 0 <= chunk_overlap < chunk_size.
  Segmenter(int chunk_size, int chunk_overlap);

  std::vector<std::string> chunk_text(const std::string &text) const;

  // Chunks every document in order and stamps chunk_id / total_chunks.
  std::vector<Chunk> chunk_documents(const std::vector<Document> &documents) const;

  int chunk_size() const { return chunk_size_; }
  int chunk_overlap() const { return chunk_overlap_; }

 private:
  int chunk_size_;
  int chunk_overlap_;
};

}  // namespace codequery_core
