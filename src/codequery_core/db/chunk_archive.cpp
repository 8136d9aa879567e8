#include "codequery_core/db/chunk_archive.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

#include "codequery_core/db/sqlite_error_utils.hpp"
#include "codequery_core/db/transaction.hpp"

namespace codequery_core {

ChunkArchive::ChunkArchive(const std::filesystem::path &directory) : directory_(directory) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw ChunkArchiveError("Failed to create archive directory " + directory_.string() + ": " +
                            ec.message());
  }

  try {
    db_ = std::make_unique<sqlite::database>((directory_ / CHUNKS_FILE).string());
    setup_schema();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("open archive " + directory_.string(), e));
  }
}

ChunkArchive ChunkArchive::open_existing(const std::filesystem::path &directory) {
  if (!exists(directory)) {
    throw ChunkArchiveError("No saved index found at " + directory.string());
  }
  return ChunkArchive(directory);
}

bool ChunkArchive::exists(const std::filesystem::path &directory) {
  return std::filesystem::is_regular_file(directory / CHUNKS_FILE);
}

void ChunkArchive::setup_schema() {
  *db_ << R"(
      CREATE TABLE IF NOT EXISTS archive_info (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";

  // position is the vector's position in the faiss index
  *db_ << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          position INTEGER PRIMARY KEY,
          filepath TEXT NOT NULL,
          filename TEXT NOT NULL,
          chunk_id INTEGER NOT NULL,
          total_chunks INTEGER NOT NULL,
          content BLOB,
          content_sha256 TEXT NOT NULL
      )
    )";

  *db_ << R"(
      CREATE TABLE IF NOT EXISTS vocabulary (
          term TEXT PRIMARY KEY,
          column_index INTEGER NOT NULL,
          idf REAL NOT NULL
      )
    )";
}

void ChunkArchive::clear() {
  try {
    Transaction tx(*db_);
    *db_ << "DELETE FROM archive_info;";
    *db_ << "DELETE FROM chunks;";
    *db_ << "DELETE FROM vocabulary;";
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("clear", e));
  }

  std::error_code ec;
  std::filesystem::remove(index_path(), ec);
  std::filesystem::remove(projection_path(), ec);
}

void ChunkArchive::write_info(const std::string &key, const std::string &value) {
  try {
    *db_ << "INSERT OR REPLACE INTO archive_info (key, value) VALUES (?, ?);" << key << value;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("write_info", e));
  }
}

std::optional<std::string> ChunkArchive::read_info(const std::string &key) {
  try {
    std::optional<std::string> value;
    *db_ << "SELECT value FROM archive_info WHERE key = ?;" << key >>
        [&](std::string stored) { value = std::move(stored); };
    return value;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("read_info", e));
  }
}

void ChunkArchive::write_chunks(const std::vector<Chunk> &chunks) {
  try {
    Transaction tx(*db_);
    *db_ << "DELETE FROM chunks;";

    auto insert = *db_ << "INSERT INTO chunks (position, filepath, filename, chunk_id, "
                          "total_chunks, content, content_sha256) VALUES (?,?,?,?,?,?,?);";
    for (std::size_t position = 0; position < chunks.size(); ++position) {
      const Chunk &chunk = chunks[position];
      std::vector<char> content_blob(chunk.content.begin(), chunk.content.end());
      insert << static_cast<long long>(position) << chunk.filepath << chunk.filename
             << chunk.chunk_id << chunk.total_chunks << content_blob
             << content_digest(chunk.content);
      insert.execute();
    }
    insert.used(true);

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("write_chunks", e));
  }
}

std::vector<Chunk> ChunkArchive::read_chunks() {
  std::vector<Chunk> chunks;
  try {
    *db_ << "SELECT position, filepath, filename, chunk_id, total_chunks, content, content_sha256 "
            "FROM chunks ORDER BY position;" >>
        [&](long long position, std::string filepath, std::string filename, int chunk_id,
            int total_chunks, std::vector<char> content_blob, std::string stored_digest) {
          if (position != static_cast<long long>(chunks.size())) {
            throw ArchiveCorruptionError("Chunk archive has no chunk at position " +
                                         std::to_string(chunks.size()) + " (next stored position is " +
                                         std::to_string(position) + ")");
          }

          Chunk chunk;
          chunk.content.assign(content_blob.begin(), content_blob.end());
          if (content_digest(chunk.content) != stored_digest) {
            throw ArchiveCorruptionError("Content digest mismatch for chunk at position " +
                                         std::to_string(position) + " (" + filepath + ")");
          }
          chunk.filepath = std::move(filepath);
          chunk.filename = std::move(filename);
          chunk.chunk_id = chunk_id;
          chunk.total_chunks = total_chunks;
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("read_chunks", e));
  }
  return chunks;
}

std::size_t ChunkArchive::chunk_count() {
  try {
    long long count = 0;
    *db_ << "SELECT COUNT(*) FROM chunks;" >> count;
    return static_cast<std::size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("chunk_count", e));
  }
}

void ChunkArchive::write_vocabulary(const std::vector<VocabularyEntry> &entries) {
  try {
    Transaction tx(*db_);
    *db_ << "DELETE FROM vocabulary;";

    auto insert = *db_ << "INSERT INTO vocabulary (term, column_index, idf) VALUES (?,?,?);";
    for (const auto &entry : entries) {
      insert << entry.term << entry.column << static_cast<double>(entry.idf);
      insert.execute();
    }
    insert.used(true);

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("write_vocabulary", e));
  }
}

std::vector<VocabularyEntry> ChunkArchive::read_vocabulary() {
  std::vector<VocabularyEntry> entries;
  try {
    *db_ << "SELECT term, column_index, idf FROM vocabulary ORDER BY column_index;" >>
        [&](std::string term, int column, double idf) {
          entries.push_back({std::move(term), column, static_cast<float>(idf)});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkArchiveError(format_db_error("read_vocabulary", e));
  }
  return entries;
}

std::string ChunkArchive::content_digest(const std::string &content) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw ChunkArchiveError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ChunkArchiveError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ChunkArchiveError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ChunkArchiveError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

}  // namespace codequery_core
