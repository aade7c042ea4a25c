#pragma once

#include <map>
#include <string>

namespace voxrag_core {

enum class EmbeddingBackend { Ollama, Hashing };

std::string to_string(EmbeddingBackend backend);
EmbeddingBackend embedding_backend_from_string(const std::string &str);

// Pass-through settings for the generation capability.
struct GenerationOptions {
  float temperature = 0.7f;
  int max_output_tokens = 150;
  std::map<std::string, std::string> safety_thresholds = {
      {"HARM_CATEGORY_HARASSMENT", "BLOCK_NONE"},
      {"HARM_CATEGORY_HATE_SPEECH", "BLOCK_NONE"},
      {"HARM_CATEGORY_SEXUALLY_EXPLICIT", "BLOCK_NONE"},
      {"HARM_CATEGORY_DANGEROUS_CONTENT", "BLOCK_NONE"},
  };
};

// Everything the RAG core needs, with defaults applied. The API layer's Config
// fills this in from JSON; tests construct it directly.
struct RagOptions {
  // Corpus and embeddings
  std::string knowledge_base_path = "./knowledge_base";
  std::string ollama_url = "http://localhost:11434";
  EmbeddingBackend embedding_backend = EmbeddingBackend::Ollama;
  std::string embedding_model = "all-minilm";
  int hashing_dimensions = 384;
  std::string generation_model = "llama3.2";
  int chunk_max_chars = 500;

  // Retrieval and prompt assembly
  int top_k = 3;
  int prompt_char_budget = 4000;
  int conversation_turn_budget = 6;
  int context_char_limit = 400;

  // Generation and fallback
  int generation_timeout_ms = 10000;
  std::string fallback_response_text =
      "I apologize, I encountered an error. Could you please repeat that?";
  bool contextual_fallback = false;
  std::string welcome_text =
      "Hello! I'm your AI voice assistant. I can answer questions about our services. How "
      "can I help you today?";
  GenerationOptions generation;

  // Throws std::invalid_argument naming the first offending option.
  void validate() const;
};

}  // namespace voxrag_core
