#include "codequery_core/vector_store.hpp"

#include <faiss/index_io.h>

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace codequery_core {

VectorStore::VectorStore() = default;

VectorStore::~VectorStore() = default;

VectorStore::VectorStore(VectorStore &&) noexcept = default;

VectorStore &VectorStore::operator=(VectorStore &&) noexcept = default;

void VectorStore::build(std::vector<Chunk> chunks, const std::vector<std::vector<float>> &vectors) {
  if (vectors.size() != chunks.size()) {
    throw VectorStoreError("Cannot build index: " + std::to_string(vectors.size()) +
                           " vectors for " + std::to_string(chunks.size()) + " chunks");
  }

  if (vectors.empty()) {
    index_.reset();
    chunks_.clear();
    return;
  }

  const std::size_t dim = vectors.front().size();
  if (dim == 0) {
    throw VectorStoreError("Cannot build index from zero-dimensional vectors");
  }

  std::vector<float> flat;
  flat.reserve(vectors.size() * dim);
  for (std::size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dim) {
      throw VectorStoreError("Vector " + std::to_string(i) + " has dimension " +
                             std::to_string(vectors[i].size()) + ", expected " +
                             std::to_string(dim));
    }
    flat.insert(flat.end(), vectors[i].begin(), vectors[i].end());
  }

  auto index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dim));
  index->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());

  index_ = std::move(index);
  chunks_ = std::move(chunks);
  std::cout << "Index built with " << index_->ntotal << " vectors" << std::endl;
}

std::vector<SearchHit> VectorStore::search(const std::vector<float> &query_vector, int k) const {
  if (!index_ || index_->ntotal == 0 || k <= 0) {
    return {};
  }
  if (query_vector.size() != static_cast<std::size_t>(index_->d)) {
    throw VectorStoreError("Query vector has dimension " + std::to_string(query_vector.size()) +
                           ", index expects " + std::to_string(index_->d));
  }

  const int actual_k = std::min(k, static_cast<int>(index_->ntotal));
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  index_->search(1, query_vector.data(), actual_k, distances.data(), labels.data());

  std::vector<SearchHit> hits;
  hits.reserve(actual_k);
  for (int i = 0; i < actual_k; ++i) {
    if (labels[i] < 0 || static_cast<std::size_t>(labels[i]) >= chunks_.size()) {
      continue;
    }
    hits.push_back({static_cast<std::size_t>(labels[i]), distances[i]});
  }

  std::stable_sort(hits.begin(), hits.end(), [](const SearchHit &a, const SearchHit &b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.position < b.position;
  });
  return hits;
}

const Chunk &VectorStore::chunk_at(std::size_t position) const {
  if (position >= chunks_.size()) {
    throw VectorStoreError("No chunk at position " + std::to_string(position));
  }
  return chunks_[position];
}

std::size_t VectorStore::count() const {
  return index_ ? static_cast<std::size_t>(index_->ntotal) : 0;
}

int VectorStore::dimension() const {
  return index_ ? static_cast<int>(index_->d) : 0;
}

void VectorStore::save(ChunkArchive &archive) const {
  std::error_code ec;
  std::filesystem::remove(archive.index_path(), ec);

  if (index_) {
    try {
      faiss::write_index(index_.get(), archive.index_path().string().c_str());
    } catch (const std::exception &e) {
      throw VectorStoreError("Failed to write index: " + std::string(e.what()));
    }
  }

  archive.write_chunks(chunks_);
  archive.write_info("vector_count", std::to_string(count()));
  archive.write_info("dimension", std::to_string(dimension()));
}

VectorStore VectorStore::load(ChunkArchive &archive) {
  VectorStore store;
  std::vector<Chunk> chunks = archive.read_chunks();

  std::size_t expected = chunks.size();
  if (auto stored_count = archive.read_info("vector_count")) {
    try {
      expected = static_cast<std::size_t>(std::stoull(*stored_count));
    } catch (const std::exception &) {
      throw ArchiveCorruptionError("Archive has an unreadable vector count: " + *stored_count);
    }
  }

  if (std::filesystem::exists(archive.index_path())) {
    std::unique_ptr<faiss::Index> loaded;
    try {
      loaded.reset(faiss::read_index(archive.index_path().string().c_str()));
    } catch (const std::exception &e) {
      throw ArchiveCorruptionError("Failed to read index blob: " + std::string(e.what()));
    }
    auto *flat = dynamic_cast<faiss::IndexFlatL2 *>(loaded.get());
    if (!flat) {
      throw ArchiveCorruptionError("Index blob is not an exact L2 index");
    }
    loaded.release();
    store.index_.reset(flat);
  }

  if (store.count() != chunks.size() || store.count() != expected) {
    throw ArchiveCorruptionError("Index holds " + std::to_string(store.count()) +
                                 " vectors but the archive lists " +
                                 std::to_string(chunks.size()) + " chunks");
  }

  store.chunks_ = std::move(chunks);
  std::cout << "Loaded index with " << store.count() << " vectors from "
            << archive.directory().string() << std::endl;
  return store;
}

}  // namespace codequery_core
