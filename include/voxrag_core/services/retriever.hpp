#pragma once

#include <memory>
#include <string>

#include "voxrag_core/index/embedding_index.hpp"
#include "voxrag_core/llm/embedder.hpp"

namespace voxrag_core {

class Retriever {
 public:
  // Throws EmbeddingMismatchError when the index was built by a different
  // embedding model than `embedder`.
  Retriever(std::shared_ptr<const EmbeddingIndex> index,
            std::shared_ptr<Embedder> embedder,
            size_t default_top_k = 3);

  // Embeds the query and returns its k nearest documents. Throws EmptyIndexError
  // before the index is built and EmbeddingMismatchError if it was built by
  // another embedding model.
  RetrievalResult retrieve(const std::string &query_text, size_t k);
  RetrievalResult retrieve(const std::string &query_text);

  size_t default_top_k() const {
    return default_top_k_;
  }

 private:
  void check_embedding_model() const;

  std::shared_ptr<const EmbeddingIndex> index_;
  std::shared_ptr<Embedder> embedder_;
  size_t default_top_k_;
};

}  // namespace voxrag_core
