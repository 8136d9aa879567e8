#pragma once

#include <string>

namespace codequery_core {

// A source file handed to the core by the repository reader.
struct Document {
  std::string content;
  std::string filepath;
  std::string filename;
  std::string extension;
};

}  // namespace codequery_core
