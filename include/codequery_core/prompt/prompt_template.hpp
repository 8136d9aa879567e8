#pragma once

#include <string>
#include <vector>

#include "codequery_core/types/chunk.hpp"

namespace codequery_core {

// The answer prompt. Chunks are costed and rendered through the same functions, so a
// prompt's size is exactly scaffold(query) plus the sum of its chunk blocks.
class PromptTemplate {
 public:
  // Instructions and query with an empty context section
  static std::string scaffold(const std::string &query);

  // One context block; `position` is 1-based within the accepted list.
  static std::string render_chunk(std::size_t position, const std::string &filepath,
                                  const std::string &content);

  static std::string render_context(const std::vector<Chunk> &chunks);
  static std::string render_prompt(const std::string &query, const std::vector<Chunk> &chunks);

 private:
  static std::string assemble(const std::string &context, const std::string &query);
};

}  // namespace codequery_core
