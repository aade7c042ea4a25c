#include "voxrag_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "ollama.hpp"
#include "voxrag_core/errors.hpp"
#include "voxrag_core/text_utils.hpp"

namespace voxrag_core {

namespace {

bool looks_like_timeout(std::string message) {
  std::transform(message.begin(), message.end(), message.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return message.find("timeout") != std::string::npos ||
         message.find("timed out") != std::string::npos ||
         message.find("failed to read") != std::string::npos;
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           int request_timeout_ms)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model),
      request_timeout_ms_(request_timeout_ms) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // Set the server URL for ollama-hpp
  ollama::setServerURL(ollama_url_);

  // ollama-hpp takes whole seconds; round up so the HTTP layer never gives up
  // before the caller's own deadline
  int timeout_seconds = std::max(1, (request_timeout_ms_ + 999) / 1000);
  ollama::setReadTimeout(timeout_seconds);
  ollama::setWriteTimeout(timeout_seconds);

  // Generation failures are reported per request, so an unreachable server is
  // only a warning here
  if (!is_server_available()) {
    std::cerr << "Warning: Ollama server is not running at " << ollama_url_ << std::endl;
  }
}

std::string OllamaClient::model_id() const {
  return "ollama:" + embedding_model_;
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    // Get the JSON structure
    auto json_response = response.as_json();

    if (json_response.contains("embedding")) {
      return json_response["embedding"].get<std::vector<float>>();
    }
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (embeddings.is_array()) {
      if (embeddings.size() > 0 && embeddings[0].is_array()) {
        // Array of arrays - take the first embedding vector
        return embeddings[0].get<std::vector<float>>();
      } else {
        // Single array of floats
        return embeddings.get<std::vector<float>>();
      }
    } else {
      throw OllamaError("Embeddings field is not an array");
    }

  } catch (const ollama::exception &e) {
    // Wrap ollama-hpp exceptions in your custom exception
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &prompt, const GenerationOptions &options) {
  // Ollama has no content-safety thresholds; only sampling options map across
  ollama::options request_options;
  request_options["temperature"] = options.temperature;
  request_options["num_predict"] = options.max_output_tokens;

  nlohmann::json json_response;
  try {
    ollama::response response = ollama::generate(generation_model_, prompt, request_options);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    std::string message = e.what();
    if (looks_like_timeout(message)) {
      throw GenerationTimeoutError("Generation timed out: " + message);
    }
    throw GenerationUnavailableError("Generation failed: " + message);
  }

  if (json_response.contains("error")) {
    throw GenerationUnavailableError("Ollama returned an error: " +
                                     json_response["error"].dump());
  }

  std::string text = json_response.value("response", std::string());
  if (text::is_blank(text)) {
    // An empty completion is how a blocked answer surfaces
    throw GenerationRejectedError("Generation returned no text for model " + generation_model_);
  }
  return text;
}

bool OllamaClient::is_server_available() const {
  return ollama::is_running();
}

}  // namespace voxrag_core
