#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codequery_core {

struct Citation {
  std::string filepath;
  float score = 0.0f;
  std::string preview;
};

struct AnswerResult {
  std::string answer;
  std::vector<Citation> sources;
  std::size_t chunks_used = 0;
  std::size_t chunks_retrieved = 0;
};

}  // namespace codequery_core
