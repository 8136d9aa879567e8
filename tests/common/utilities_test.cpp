#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <fstream>

namespace codequery_tests {

std::filesystem::path TestUtilities::create_temp_test_dir(const std::string& label) {
  static std::atomic<int> counter{0};

  // Generate unique directory name using timestamp and a counter
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

  auto dir = std::filesystem::temp_directory_path() / "codequery_tests" /
             (label + "_" + std::to_string(timestamp) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = dir.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

void TestUtilities::write_file(const std::filesystem::path& path, const std::string& contents) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << contents;
}

codequery_core::Chunk TestUtilities::create_test_chunk(const std::string& filepath,
                                                       const std::string& content, int chunk_id,
                                                       int total_chunks) {
  codequery_core::Chunk chunk;
  chunk.content = content;
  chunk.filepath = filepath;
  chunk.filename = std::filesystem::path(filepath).filename().string();
  chunk.chunk_id = chunk_id;
  chunk.total_chunks = total_chunks;
  return chunk;
}

codequery_core::RetrievalResult TestUtilities::create_test_candidate(const std::string& filepath,
                                                                     const std::string& content,
                                                                     float distance) {
  return {create_test_chunk(filepath, content), distance};
}

codequery_core::Document TestUtilities::create_test_document(const std::string& filepath,
                                                             const std::string& content) {
  std::filesystem::path path(filepath);
  return {content, filepath, path.filename().string(), path.extension().string()};
}

std::vector<codequery_core::Document> TestUtilities::create_test_corpus() {
  return {
      create_test_document("src/parser.cpp",
                           "Parser reads tokens from the lexer and builds syntax trees. "
                           "The parser reports syntax errors with line numbers."),
      create_test_document("src/network.cpp",
                           "Socket connection handling for the network server. Accepts "
                           "clients, reads requests and writes responses over sockets."),
      create_test_document("src/storage.cpp",
                           "Storage engine writes pages to disk and caches hot pages in "
                           "memory. Pages are flushed when the cache evicts them."),
      create_test_document("docs/README.md",
                           "Build instructions: run cmake, compile the sources, run the "
                           "tests. The project documentation describes the parser, network "
                           "server and storage engine."),
  };
}

codequery_core::Config TestUtilities::create_sparse_config(int sparse_dimension) {
  return codequery_core::Config::from_json({{"embedding_strategy", "sparse"},
                                            {"sparse_dimension", sparse_dimension},
                                            {"chunk_size", 200},
                                            {"chunk_overlap", 20},
                                            {"top_k", 3}});
}

}  // namespace codequery_tests
