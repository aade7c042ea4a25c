#include "voxrag_core/rag_options.hpp"

#include <stdexcept>

namespace voxrag_core {

std::string to_string(EmbeddingBackend backend) {
  switch (backend) {
    case EmbeddingBackend::Ollama:
      return "ollama";
    case EmbeddingBackend::Hashing:
      return "hashing";
    default:
      return "unknown";
  }
}

EmbeddingBackend embedding_backend_from_string(const std::string &str) {
  if (str == "ollama")
    return EmbeddingBackend::Ollama;
  if (str == "hashing")
    return EmbeddingBackend::Hashing;
  throw std::invalid_argument("Unknown embedding_backend: " + str);
}

void RagOptions::validate() const {
  if (knowledge_base_path.empty()) {
    throw std::invalid_argument("knowledge_base_path cannot be empty");
  }
  if (embedding_backend == EmbeddingBackend::Ollama) {
    if (ollama_url.empty()) {
      throw std::invalid_argument("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::invalid_argument("embedding_model cannot be empty");
    }
  }
  if (generation_model.empty()) {
    throw std::invalid_argument("generation_model cannot be empty");
  }
  if (hashing_dimensions < 8) {
    throw std::invalid_argument("hashing_dimensions must be at least 8");
  }
  if (chunk_max_chars < 50) {
    throw std::invalid_argument("chunk_max_chars must be at least 50");
  }
  if (top_k < 1) {
    throw std::invalid_argument("top_k must be at least 1");
  }
  if (prompt_char_budget < 64) {
    throw std::invalid_argument("prompt_char_budget must be at least 64");
  }
  if (conversation_turn_budget < 0) {
    throw std::invalid_argument("conversation_turn_budget cannot be negative");
  }
  if (context_char_limit < 1) {
    throw std::invalid_argument("context_char_limit must be at least 1");
  }
  if (generation_timeout_ms < 1) {
    throw std::invalid_argument("generation_timeout_ms must be at least 1");
  }
  if (fallback_response_text.empty()) {
    throw std::invalid_argument("fallback_response_text cannot be empty");
  }
  if (generation.temperature < 0.0f || generation.temperature > 2.0f) {
    throw std::invalid_argument("temperature must be between 0 and 2");
  }
  if (generation.max_output_tokens < 1) {
    throw std::invalid_argument("max_output_tokens must be at least 1");
  }
}

}  // namespace voxrag_core
