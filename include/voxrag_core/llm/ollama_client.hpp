#pragma once

#include <string>
#include <vector>

#include "voxrag_core/llm/embedder.hpp"
#include "voxrag_core/llm/response_generator.hpp"

namespace voxrag_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Talks to an Ollama server for both embeddings and text generation.
class OllamaClient : public Embedder, public ResponseGenerator {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               int request_timeout_ms);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::string model_id() const override;

  // Throws OllamaError when the server cannot produce an embedding
  std::vector<float> get_embedding(const std::string &text) override;

  std::string generate(const std::string &prompt, const GenerationOptions &options) override;

  bool is_server_available() const;

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  int request_timeout_ms_;

  // Helper methods
  void setup_server_connection();
};

}  // namespace voxrag_core
