#include "codequery_core/segmenter.hpp"

#include <algorithm>

#include "codequery_core/text_utils.hpp"

namespace codequery_core {

Segmenter::Segmenter(int chunk_size, int chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap) {
  if (chunk_size_ <= 0) {
    throw SegmenterError("chunk_size must be positive, got " + std::to_string(chunk_size_));
  }
  if (chunk_overlap_ < 0 || chunk_overlap_ >= chunk_size_) {
    throw SegmenterError("chunk_overlap must be in [0, chunk_size), got overlap " +
                         std::to_string(chunk_overlap_) + " for size " +
                         std::to_string(chunk_size_));
  }
}

/**
 * @brief Sliding-window chunking with newline-aware window ends.
 *
 * Positions are character positions (see text::character_offsets). A window that
 * ends before the end of the text is shortened to its last newline when that
 * newline lies past the middle of the window. The newline itself starts the next
 * window's overlap rather than ending this one.
 */
std::vector<std::string> Segmenter::chunk_text(const std::string &text) const {
  const std::vector<std::size_t> offsets = text::character_offsets(text);
  const std::size_t length = offsets.size() - 1;
  const auto size = static_cast<std::size_t>(chunk_size_);
  const auto overlap = static_cast<std::size_t>(chunk_overlap_);

  if (length <= size) {
    return {text};
  }

  std::vector<std::string> chunks;
  std::size_t start = 0;
  while (start < length) {
    std::size_t end = start + size;

    if (end < length) {
      // Last newline inside [start, end), measured from the window start
      for (std::size_t pos = end; pos > start; --pos) {
        if (text[offsets[pos - 1]] == '\n') {
          const std::size_t last_newline = pos - 1 - start;
          if (last_newline > size / 2) {
            end = start + last_newline;
          }
          break;
        }
      }
    }

    const std::size_t stop = std::min(end, length);
    chunks.emplace_back(text, offsets[start], offsets[stop] - offsets[start]);

    if (stop == length) {
      break;
    }

    const std::size_t next = end - overlap;
    start = next > start ? next : start + 1;
  }

  return chunks;
}

std::vector<Chunk> Segmenter::chunk_documents(const std::vector<Document> &documents) const {
  std::vector<Chunk> chunked;

  for (const auto &document : documents) {
    std::vector<std::string> pieces = chunk_text(document.content);
    const int total = static_cast<int>(pieces.size());

    for (int i = 0; i < total; ++i) {
      Chunk chunk;
      chunk.content = std::move(pieces[i]);
      chunk.filepath = document.filepath;
      chunk.filename = document.filename;
      chunk.chunk_id = i;
      chunk.total_chunks = total;
      chunked.push_back(std::move(chunk));
    }
  }

  return chunked;
}

}  // namespace codequery_core
