#include "codequery_core/text_utils.hpp"

#include <utf8.h>

namespace codequery_core::text {

std::vector<std::size_t> character_offsets(const std::string &text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);

  if (!utf8::is_valid(text.begin(), text.end())) {
    for (std::size_t i = 0; i <= text.size(); ++i) {
      offsets.push_back(i);
    }
    return offsets;
  }

  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<std::size_t>(it - text.begin()));
  }
  offsets.push_back(text.size());
  return offsets;
}

std::size_t character_count(const std::string &text) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.size();
  }
  return static_cast<std::size_t>(utf8::distance(text.begin(), text.end()));
}

std::string prefix(const std::string &text, std::size_t max_chars) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.substr(0, max_chars);
  }

  auto it = text.begin();
  for (std::size_t taken = 0; taken < max_chars && it != text.end(); ++taken) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

}  // namespace codequery_core::text
