#pragma once

#include <memory>

#include "voxrag_core/index/embedding_index.hpp"
#include "voxrag_core/llm/bounded_generator.hpp"
#include "voxrag_core/llm/embedder.hpp"
#include "voxrag_core/llm/response_generator.hpp"
#include "voxrag_core/rag_options.hpp"
#include "voxrag_core/services/orchestrator.hpp"
#include "voxrag_core/services/retriever.hpp"

namespace voxrag_core {

/**
 * @class RagContext
 * @brief The process-wide pieces shared by every session: the loaded corpus
 * index, the retriever and the generation capability.
 *
 * Built once at startup and passed explicitly to whoever needs it.
 */
class RagContext {
 private:
  struct PrivateTag {};

 public:
  // Use build()
  explicit RagContext(PrivateTag) {}

  // Loads the corpus, builds the index and connects to Ollama. Throws LoadError,
  // EmptyCorpusError, DimensionMismatchError or EmbeddingMismatchError.
  static std::shared_ptr<RagContext> build(const RagOptions &options);

  // Same, with caller-provided capabilities
  static std::shared_ptr<RagContext> build(const RagOptions &options,
                                           std::shared_ptr<Embedder> embedder,
                                           std::shared_ptr<ResponseGenerator> generator);

  // Fresh per-session orchestrator over the shared retriever and generator
  std::unique_ptr<Orchestrator> make_orchestrator() const;

  const RagOptions &options() const {
    return options_;
  }

  std::shared_ptr<const EmbeddingIndex> index() const {
    return index_;
  }

  std::shared_ptr<Retriever> retriever() const {
    return retriever_;
  }

  // Shared by every session; shutdown waits on it for abandoned calls
  std::shared_ptr<BoundedGenerator> generator() const {
    return generator_;
  }

 private:
  RagOptions options_;
  std::shared_ptr<const EmbeddingIndex> index_;
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<BoundedGenerator> generator_;
};

}  // namespace voxrag_core
