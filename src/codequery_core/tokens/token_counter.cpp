#include "codequery_core/tokens/token_counter.hpp"

namespace codequery_core {

std::size_t HeuristicTokenCounter::count(const std::string &text) const {
  return (text.size() + BYTES_PER_TOKEN - 1) / BYTES_PER_TOKEN;
}

std::string HeuristicTokenCounter::name() const {
  return "heuristic";
}

CallbackTokenCounter::CallbackTokenCounter(std::string name, CountFn count_fn)
    : name_(std::move(name)), count_fn_(std::move(count_fn)) {
  if (!count_fn_) {
    throw TokenCounterError("Token counter '" + name_ + "' has no counting function");
  }
}

std::size_t CallbackTokenCounter::count(const std::string &text) const {
  return count_fn_(text);
}

std::string CallbackTokenCounter::name() const {
  return name_;
}

std::shared_ptr<TokenCounter> make_token_counter(const std::string &name) {
  if (name == "heuristic") {
    return std::make_shared<HeuristicTokenCounter>();
  }
  throw TokenCounterError("Unknown token counter: " + name);
}

}  // namespace codequery_core
