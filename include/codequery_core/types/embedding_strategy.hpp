#pragma once

#include <string>

namespace codequery_core {

// How the session picks its embedding provider. Auto prefers the dense model and
// falls back to the sparse projection when the model cannot be reached.
enum class EmbeddingStrategy { Auto, Dense, Sparse };

// Conversion utilities
std::string to_string(EmbeddingStrategy strategy);
EmbeddingStrategy embedding_strategy_from_string(const std::string& str);

}  // namespace codequery_core
