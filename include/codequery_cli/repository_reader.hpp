#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "codequery_core/types/document.hpp"

namespace codequery_cli
{

  // Collects the source and text files of a checked-out repository as Documents.
  class RepositoryReader
  {
  public:
    static constexpr std::size_t DEFAULT_MAX_FILE_SIZE = 500000;

    explicit RepositoryReader(std::size_t max_file_size = DEFAULT_MAX_FILE_SIZE);

    // Walks `root` recursively. Filepaths are relative to `root`; results are sorted by path.
    std::vector<codequery_core::Document> read(const std::filesystem::path &root) const;

    static bool is_supported_extension(const std::string &extension);
    static bool is_skipped_directory(const std::string &name);

  private:
    std::size_t max_file_size_;

    bool should_skip(const std::filesystem::path &relative_path) const;
  };

}
