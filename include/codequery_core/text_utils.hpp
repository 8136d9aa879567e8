#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codequery_core::text {

// Byte offset of every character boundary in `text`, with text.size() as the last entry.
// Characters are UTF-8 code points when the text is valid UTF-8, bytes otherwise.
std::vector<std::size_t> character_offsets(const std::string &text);

// Number of characters in `text`, counted the same way as character_offsets.
std::size_t character_count(const std::string &text);

// The first `max_chars` characters of `text`; never splits a multi-byte sequence.
std::string prefix(const std::string &text, std::size_t max_chars);

}  // namespace codequery_core::text
