#include "voxrag_core/rag_context.hpp"

#include <iostream>
#include <stdexcept>

#include "voxrag_core/document_store.hpp"
#include "voxrag_core/extractors/plaintext_extractor.hpp"
#include "voxrag_core/llm/hashing_embedder.hpp"
#include "voxrag_core/llm/ollama_client.hpp"

namespace voxrag_core {

std::shared_ptr<RagContext> RagContext::build(const RagOptions &options) {
  options.validate();

  auto ollama_client = std::make_shared<OllamaClient>(options.ollama_url,
                                                      options.embedding_model,
                                                      options.generation_model,
                                                      options.generation_timeout_ms);

  std::shared_ptr<Embedder> embedder;
  switch (options.embedding_backend) {
    case EmbeddingBackend::Hashing:
      embedder = std::make_shared<HashingEmbedder>(static_cast<size_t>(options.hashing_dimensions));
      break;
    case EmbeddingBackend::Ollama:
    default:
      embedder = ollama_client;
      break;
  }

  return build(options, std::move(embedder), std::move(ollama_client));
}

std::shared_ptr<RagContext> RagContext::build(const RagOptions &options,
                                              std::shared_ptr<Embedder> embedder,
                                              std::shared_ptr<ResponseGenerator> generator) {
  options.validate();
  if (!embedder || !generator) {
    throw std::invalid_argument("RagContext requires an embedder and a response generator");
  }

  std::cout << "Loading knowledge base from " << options.knowledge_base_path << std::endl;
  DocumentStore store(
      std::make_shared<PlainTextExtractor>(static_cast<size_t>(options.chunk_max_chars)));
  std::vector<DocumentPtr> documents = store.load(options.knowledge_base_path);

  auto index = std::make_shared<EmbeddingIndex>();
  index->build(documents, *embedder);

  auto context = std::make_shared<RagContext>(PrivateTag{});
  context->options_ = options;
  context->index_ = index;
  context->retriever_ =
      std::make_shared<Retriever>(index, std::move(embedder), static_cast<size_t>(options.top_k));
  context->generator_ = std::make_shared<BoundedGenerator>(std::move(generator));
  return context;
}

std::unique_ptr<Orchestrator> RagContext::make_orchestrator() const {
  return std::make_unique<Orchestrator>(retriever_, generator_, options_);
}

}  // namespace voxrag_core
