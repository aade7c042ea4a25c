#pragma once

#include <fstream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "voxrag_core/rag_options.hpp"

class Config {
 public:
  std::string api_base_url;

  // Everything the RAG core consumes
  voxrag_core::RagOptions rag;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }
    for (const auto& item : json_config.items()) {
      if (known_keys().count(item.key()) == 0) {
        throw std::runtime_error("Unknown configuration key: " + item.key());
      }
    }

    Config config;
    voxrag_core::RagOptions& rag = config.rag;

    // Apply defaults when keys are missing
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      rag.knowledge_base_path = json_config.value("knowledge_base_path", rag.knowledge_base_path);
      rag.ollama_url = json_config.value("ollama_url", rag.ollama_url);
      rag.embedding_backend = voxrag_core::embedding_backend_from_string(
          json_config.value("embedding_backend", voxrag_core::to_string(rag.embedding_backend)));
      rag.embedding_model = json_config.value("embedding_model", rag.embedding_model);
      rag.hashing_dimensions = json_config.value("hashing_dimensions", rag.hashing_dimensions);
      rag.generation_model = json_config.value("generation_model", rag.generation_model);
      rag.chunk_max_chars = json_config.value("chunk_max_chars", rag.chunk_max_chars);

      rag.top_k = json_config.value("top_k", rag.top_k);
      rag.prompt_char_budget = json_config.value("prompt_char_budget", rag.prompt_char_budget);
      rag.conversation_turn_budget =
          json_config.value("conversation_turn_budget", rag.conversation_turn_budget);
      rag.context_char_limit = json_config.value("context_char_limit", rag.context_char_limit);

      rag.generation_timeout_ms = json_config.value("generation_timeout_ms", rag.generation_timeout_ms);
      rag.fallback_response_text =
          json_config.value("fallback_response_text", rag.fallback_response_text);
      rag.contextual_fallback = json_config.value("contextual_fallback", rag.contextual_fallback);
      rag.welcome_text = json_config.value("welcome_text", rag.welcome_text);

      // Generation pass-through options
      rag.generation.temperature = json_config.value("temperature", rag.generation.temperature);
      rag.generation.max_output_tokens =
          json_config.value("max_output_tokens", rag.generation.max_output_tokens);
      if (json_config.contains("safety_thresholds")) {
        rag.generation.safety_thresholds =
            json_config.at("safety_thresholds").get<std::map<std::string, std::string>>();
      }
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(e.what());
    }

    config.validate();
    return config;
  }

 private:
  static const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "api_base_url",       "knowledge_base_path",    "ollama_url",
        "embedding_backend",  "embedding_model",        "hashing_dimensions",
        "generation_model",   "chunk_max_chars",        "top_k",
        "prompt_char_budget", "conversation_turn_budget", "context_char_limit",
        "generation_timeout_ms", "fallback_response_text", "contextual_fallback",
        "welcome_text",       "temperature",            "max_output_tokens",
        "safety_thresholds",
    };
    return keys;
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be in host:port form");
    }
    try {
      rag.validate();
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(e.what());
    }
  }
};
