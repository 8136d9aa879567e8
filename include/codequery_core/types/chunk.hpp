#pragma once

#include <string>

namespace codequery_core {

struct Chunk {
  std::string content;
  std::string filepath;
  std::string filename;
  int chunk_id = 0;      // ordinal within the parent document
  int total_chunks = 0;  // number of chunks the parent document produced
};

// A chunk paired with its distance to the query; smaller is more relevant.
struct RetrievalResult {
  Chunk chunk;
  float distance = 0.0f;
};

}  // namespace codequery_core
