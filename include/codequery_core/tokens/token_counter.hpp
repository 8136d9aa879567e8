#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace codequery_core {

class TokenCounterError : public std::exception {
 public:
  explicit TokenCounterError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Measures text in model tokens. Implementations must be deterministic and
// monotonic in text length so that budget comparisons are reproducible.
class TokenCounter {
 public:
  virtual ~TokenCounter() = default;

  virtual std::size_t count(const std::string &text) const = 0;
  virtual std::string name() const = 0;
};

// Four bytes per token, rounded up so that count(a + b) <= count(a) + count(b). Always available.
class HeuristicTokenCounter final : public TokenCounter {
 public:
  static constexpr std::size_t BYTES_PER_TOKEN = 4;

  std::size_t count(const std::string &text) const override;
  std::string name() const override;
};

// Adapts an external tokenizer (for example a BPE encoder matching the completion
// model) to the TokenCounter interface.
class CallbackTokenCounter final : public TokenCounter {
 public:
  using CountFn = std::function<std::size_t(const std::string &)>;

  CallbackTokenCounter(std::string name, CountFn count_fn);

  std::size_t count(const std::string &text) const override;
  std::string name() const override;

 private:
  std::string name_;
  CountFn count_fn_;
};

// Selects a built-in counter by name ("heuristic"). Throws TokenCounterError otherwise.
std::shared_ptr<TokenCounter> make_token_counter(const std::string &name);

}  // namespace codequery_core
