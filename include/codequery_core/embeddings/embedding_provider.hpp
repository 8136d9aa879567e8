#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "codequery_core/db/chunk_archive.hpp"

namespace codequery_core {

// One row per input text, every row of length dimension().
using EmbeddingMatrix = std::vector<std::vector<float>>;

class EmbeddingProviderError : public std::exception {
 public:
  explicit EmbeddingProviderError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Maps text to fixed-dimension vectors. The corpus an index is built from goes
 * through encode_corpus(); queries go through encode(). A provider that learns
 * from its corpus refits in encode_corpus() and must answer queries in the space
 * it learned there.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Strategy name, "dense" or "sparse"
  virtual std::string name() const = 0;
  // Identifies the embedding space; two providers with equal identities produce
  // comparable vectors.
  virtual std::string identity() const = 0;
  virtual int dimension() const = 0;

  virtual EmbeddingMatrix encode_corpus(const std::vector<std::string> &texts) = 0;
  virtual EmbeddingMatrix encode(const std::vector<std::string> &texts) = 0;

  // Persist / restore whatever encode() needs after a reload. load_state() must
  // leave the provider untouched when the stored state does not produce vectors
  // of `expected_dimension`.
  virtual void save_state(ChunkArchive &archive) const {}
  virtual void load_state(ChunkArchive &archive, int expected_dimension) {}
};

}  // namespace codequery_core
