#pragma once

#include <exception>
#include <string>

namespace voxrag_core {

// Base of every error the RAG core raises. Callers that only need the message
// can catch this; the orchestrator dispatches on the concrete types.
class RagError : public std::exception {
 public:
  explicit RagError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// --- Startup-time errors (fatal) ---

class LoadError : public RagError {
 public:
  using RagError::RagError;
};

class EmptyCorpusError : public RagError {
 public:
  using RagError::RagError;
};

class DimensionMismatchError : public RagError {
 public:
  using RagError::RagError;
};

// --- Per-request errors (recovered into the fallback response) ---

class EmptyIndexError : public RagError {
 public:
  using RagError::RagError;
};

class EmbeddingMismatchError : public RagError {
 public:
  using RagError::RagError;
};

class PromptTooLargeError : public RagError {
 public:
  using RagError::RagError;
};

class GenerationUnavailableError : public RagError {
 public:
  using RagError::RagError;
};

class GenerationRejectedError : public RagError {
 public:
  using RagError::RagError;
};

class GenerationTimeoutError : public RagError {
 public:
  using RagError::RagError;
};

// --- Caller-contract violation (surfaced directly) ---

class EmptyQueryError : public RagError {
 public:
  using RagError::RagError;
};

}  // namespace voxrag_core
