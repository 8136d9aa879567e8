#include "codequery_core/types.hpp"

#include <stdexcept>

namespace codequery_core {

std::string to_string(EmbeddingStrategy strategy) {
  switch (strategy) {
    case EmbeddingStrategy::Auto:
      return "auto";
    case EmbeddingStrategy::Dense:
      return "dense";
    case EmbeddingStrategy::Sparse:
      return "sparse";
    default:
      return "unknown";
  }
}

EmbeddingStrategy embedding_strategy_from_string(const std::string& str) {
  if (str == "auto")
    return EmbeddingStrategy::Auto;
  if (str == "dense")
    return EmbeddingStrategy::Dense;
  if (str == "sparse")
    return EmbeddingStrategy::Sparse;
  throw std::invalid_argument("Unknown EmbeddingStrategy: " + str);
}

}  // namespace codequery_core
