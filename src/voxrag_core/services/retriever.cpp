#include "voxrag_core/services/retriever.hpp"

#include <stdexcept>

#include "voxrag_core/errors.hpp"

namespace voxrag_core {

Retriever::Retriever(std::shared_ptr<const EmbeddingIndex> index,
                     std::shared_ptr<Embedder> embedder,
                     size_t default_top_k)
    : index_(std::move(index)), embedder_(std::move(embedder)), default_top_k_(default_top_k) {
  if (!index_ || !embedder_) {
    throw std::invalid_argument("Retriever requires an index and an embedder");
  }
  if (default_top_k_ < 1) {
    throw std::invalid_argument("default_top_k must be at least 1");
  }
  if (index_->is_built()) {
    check_embedding_model();
  }
}

void Retriever::check_embedding_model() const {
  if (index_->embedding_model_id() != embedder_->model_id()) {
    throw EmbeddingMismatchError("Index was built with embedding model '" +
                                 index_->embedding_model_id() + "' but queries would use '" +
                                 embedder_->model_id() + "'");
  }
}

RetrievalResult Retriever::retrieve(const std::string &query_text, size_t k) {
  if (!index_->is_built()) {
    throw EmptyIndexError("Index has not been built. Cannot perform search.");
  }
  // The index may have been (re)built after this retriever was created
  check_embedding_model();
  std::vector<float> query_embedding = embedder_->get_embedding(query_text);
  return index_->search(query_embedding, k);
}

RetrievalResult Retriever::retrieve(const std::string &query_text) {
  return retrieve(query_text, default_top_k_);
}

}  // namespace voxrag_core
