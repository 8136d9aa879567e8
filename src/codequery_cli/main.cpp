#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

#include "codequery_cli/cli_handler.hpp"
#include "codequery_core/config.hpp"
#include "codequery_core/llm/ollama_client.hpp"

namespace {

codequery_core::Config load_config() {
  // Get config path from environment variable
  const char *config_path = std::getenv("CODEQUERY_CONFIG");
  if (config_path) {
    return codequery_core::Config::from_file(config_path);
  }
  if (std::filesystem::exists("codequeryrc.json")) {
    return codequery_core::Config::from_file("codequeryrc.json");
  }
  return codequery_core::Config::from_json(nlohmann::json::object());
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    codequery_core::Config config = load_config();

    std::shared_ptr<codequery_core::LlmClient> llm_client;
    try {
      llm_client = std::make_shared<codequery_core::OllamaClient>(
          config.ollama_url, config.embedding_model, config.completion_model);
    } catch (const codequery_core::OllamaError &e) {
      std::cerr << "Warning: " << e.what() << std::endl;
    }

    // Create CLI handler
    codequery_cli::CliHandler handler(config, llm_client);

    // Parse command line arguments
    codequery_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
