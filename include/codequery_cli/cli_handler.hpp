#pragma once

#include <memory>
#include <string>

#include "codequery_core/config.hpp"
#include "codequery_core/llm/llm_client.hpp"
#include "codequery_core/retrieval_session.hpp"

namespace codequery_cli
{

  enum class Command
  {
    Index,
    Search,
    Ask,
    Help
  };

  struct CliOptions
  {
    Command command;
    std::string directory;   // index: repository to read
    std::string index_path;  // where the index is written or read; empty means the configured one
    std::string query;
    int top_k;               // 0 means the configured top_k
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    // `llm_client` may be null when no model service is reachable.
    CliHandler(codequery_core::Config config, std::shared_ptr<codequery_core::LlmClient> llm_client);

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    const codequery_core::Config &config() const { return config_; }

  private:
    codequery_core::Config config_;
    std::shared_ptr<codequery_core::LlmClient> llm_client_;

    // Command handlers
    void handle_index_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // Helper methods
    std::unique_ptr<codequery_core::RetrievalSession> open_session(const CliOptions &options);
    std::string resolve_index_path(const CliOptions &options) const;
    int resolve_top_k(const CliOptions &options) const;
    void print_help();
  };

}
