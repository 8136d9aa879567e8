#include "codequery_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace codequery_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &completion_model)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      completion_model_(completion_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // Set the server URL for ollama-hpp
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    return parse_embeddings(response.as_json(), 1).front();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }

  // One request for the whole batch; /api/embed accepts an array input
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, ollama::input(texts));
    return parse_embeddings(response.as_json(), texts.size());
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::parse_embeddings(const nlohmann::json &response,
                                                               std::size_t expected_rows) {
  if (!response.contains("embeddings")) {
    throw OllamaError("Response does not contain embeddings field");
  }

  const nlohmann::json &embeddings = response["embeddings"];
  if (!embeddings.is_array()) {
    throw OllamaError("Embeddings field is not an array");
  }

  std::vector<std::vector<float>> rows;
  try {
    if (!embeddings.empty() && embeddings[0].is_array()) {
      // Array of arrays, one per input
      for (const auto &row : embeddings) {
        rows.push_back(row.get<std::vector<float>>());
      }
    } else if (!embeddings.empty()) {
      // Single array of floats
      rows.push_back(embeddings.get<std::vector<float>>());
    }
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Embeddings field is malformed: " + std::string(e.what()));
  }

  if (rows.size() != expected_rows) {
    throw OllamaError("Expected " + std::to_string(expected_rows) + " embeddings, server returned " +
                      std::to_string(rows.size()));
  }
  return rows;
}

std::string OllamaClient::generate(const std::string &prompt, const GenerationOptions &options) {
  try {
    ollama::options request_options;
    request_options["temperature"] = options.temperature;
    request_options["num_predict"] = options.max_tokens;

    ollama::response response = ollama::generate(completion_model_, prompt, request_options);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Text generation failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace codequery_core
