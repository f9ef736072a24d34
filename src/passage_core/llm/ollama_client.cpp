#include "passage_core/llm/ollama_client.hpp"
#include "ollama.hpp"

namespace passage_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model) {
  // Only points the client at the server. Reachability is checked lazily so
  // that a process can start (and answer "index not found") without Ollama.
  ollama::setServerURL(ollama_url_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  std::vector<std::vector<float>> embeddings = get_embeddings({text});
  if (embeddings.empty()) {
    throw OllamaError("Response does not contain an embedding");
  }
  return std::move(embeddings.front());
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  try {
    ollama::request request(ollama::message_type::embedding);
    request["model"] = embedding_model_;
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embeddings field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() != texts.size()) {
      throw OllamaError("Expected " + std::to_string(texts.size()) + " embeddings, got " +
                        std::to_string(embeddings.size()));
    }
    return embeddings.get<std::vector<std::vector<float>>>();

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &prompt) {
  if (generation_model_.empty()) {
    throw OllamaError("No generation model configured");
  }
  try {
    ollama::response response = ollama::generate(generation_model_, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Text generation failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace passage_core
