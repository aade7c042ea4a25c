#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <string>
#include <vector>

#include "voxrag_core/llm/embedder.hpp"
#include "voxrag_core/types/document.hpp"

namespace voxrag_core {

struct IndexEntry {
  DocumentPtr document;
  std::vector<float> vector;
};

/**
 * @class EmbeddingIndex
 * @brief Exact nearest-neighbour index over one embedding per Document.
 *
 * build() is a blocking, single-writer operation and replaces everything.
 * After it returns the index is read-only and search() may be called from any
 * number of threads without locking.
 */
class EmbeddingIndex {
 public:
  EmbeddingIndex() = default;
  ~EmbeddingIndex() = default;

  // Disable copy constructor and assignment
  EmbeddingIndex(const EmbeddingIndex &) = delete;
  EmbeddingIndex &operator=(const EmbeddingIndex &) = delete;

  // Embeds every document once. Throws EmptyCorpusError or DimensionMismatchError;
  // on failure the previous contents are left untouched.
  void build(const std::vector<DocumentPtr> &documents, Embedder &embedder);

  // k nearest entries by squared L2 distance, ascending, ties broken by
  // insertion order. Returns every entry when k exceeds the corpus size.
  RetrievalResult search(const std::vector<float> &query_vector, size_t k) const;

  bool is_built() const {
    return faiss_index_ != nullptr;
  }
  size_t size() const {
    return entries_.size();
  }
  size_t dimension() const {
    return dimension_;
  }
  const std::string &embedding_model_id() const {
    return embedding_model_id_;
  }
  const std::vector<IndexEntry> &entries() const {
    return entries_;
  }

 private:
  std::vector<IndexEntry> entries_;
  std::unique_ptr<faiss::IndexFlatL2> faiss_index_;
  size_t dimension_ = 0;
  std::string embedding_model_id_;
};

}  // namespace voxrag_core
