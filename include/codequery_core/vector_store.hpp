#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <string>
#include <vector>

#include "codequery_core/db/chunk_archive.hpp"
#include "codequery_core/types/chunk.hpp"

namespace codequery_core {

struct SearchHit {
  std::size_t position;
  // Squared L2 distance; lower is more similar
  float distance;
};

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Exact nearest-neighbour index over chunk embeddings. Vector i belongs to chunk i;
 * that correspondence survives save() / load().
 */
class VectorStore {
 public:
  VectorStore();
  ~VectorStore();

  // Disable copy constructor and assignment
  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  // Allow move constructor and assignment
  VectorStore(VectorStore &&) noexcept;
  VectorStore &operator=(VectorStore &&) noexcept;

  // Replaces all contents. vectors.size() must equal chunks.size() and every vector
  // must have the same dimension.
  void build(std::vector<Chunk> chunks, const std::vector<std::vector<float>> &vectors);

  // Up to k hits in ascending distance, ties broken by position.
  std::vector<SearchHit> search(const std::vector<float> &query_vector, int k) const;

  const Chunk &chunk_at(std::size_t position) const;
  const std::vector<Chunk> &chunks() const { return chunks_; }
  std::size_t count() const;
  int dimension() const;
  bool empty() const { return count() == 0; }

  // Writes the index blob and the chunk list into `archive`.
  void save(ChunkArchive &archive) const;
  // Throws ArchiveCorruptionError when the index and chunk list disagree.
  static VectorStore load(ChunkArchive &archive);

 private:
  std::unique_ptr<faiss::IndexFlatL2> index_;
  std::vector<Chunk> chunks_;
};

}  // namespace codequery_core
