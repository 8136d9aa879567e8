#pragma once

#include <sqlite_modern_cpp.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "codequery_core/types/chunk.hpp"

namespace codequery_core {

class ChunkArchiveError : public std::exception {
 public:
  explicit ChunkArchiveError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The archive no longer matches what was saved: vector positions and chunks
// disagree, or chunk bytes changed. Not recoverable; rebuild the index.
class ArchiveCorruptionError : public std::exception {
 public:
  explicit ArchiveCorruptionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct VocabularyEntry {
  std::string term;
  int column = 0;
  float idf = 0.0f;
};

/**
 * On-disk home of one saved index: a directory holding the faiss blob, an optional
 * projection blob, and a SQLite file with the parallel chunk list, archive info and
 * any embedding-provider state.
 */
class ChunkArchive {
 public:
  static constexpr const char *INDEX_FILE = "index.faiss";
  static constexpr const char *CHUNKS_FILE = "chunks.db";
  static constexpr const char *PROJECTION_FILE = "projection.faiss";

  // Creates the directory and schema when missing.
  explicit ChunkArchive(const std::filesystem::path &directory);

  // Opens an archive that must already exist. Throws ChunkArchiveError otherwise.
  static ChunkArchive open_existing(const std::filesystem::path &directory);
  static bool exists(const std::filesystem::path &directory);

  ChunkArchive(ChunkArchive &&) noexcept = default;
  ChunkArchive &operator=(ChunkArchive &&) noexcept = default;

  const std::filesystem::path &directory() const { return directory_; }
  std::filesystem::path index_path() const { return directory_ / INDEX_FILE; }
  std::filesystem::path projection_path() const { return directory_ / PROJECTION_FILE; }

  // Drops every row and blob file; an archive is always rewritten wholesale.
  void clear();

  void write_info(const std::string &key, const std::string &value);
  std::optional<std::string> read_info(const std::string &key);

  void write_chunks(const std::vector<Chunk> &chunks);
  // Throws ArchiveCorruptionError on gaps in positions or content digest mismatches.
  std::vector<Chunk> read_chunks();
  std::size_t chunk_count();

  void write_vocabulary(const std::vector<VocabularyEntry> &entries);
  std::vector<VocabularyEntry> read_vocabulary();

  // Hex SHA-256 of the content bytes
  static std::string content_digest(const std::string &content);

 private:
  std::filesystem::path directory_;
  std::unique_ptr<sqlite::database> db_;

  void setup_schema();
};

}  // namespace codequery_core
