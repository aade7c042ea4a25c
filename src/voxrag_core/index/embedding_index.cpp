#include "voxrag_core/index/embedding_index.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "voxrag_core/errors.hpp"

namespace voxrag_core {

void EmbeddingIndex::build(const std::vector<DocumentPtr> &documents, Embedder &embedder) {
  if (documents.empty()) {
    throw EmptyCorpusError("Cannot build an index from an empty corpus");
  }

  std::vector<IndexEntry> entries;
  entries.reserve(documents.size());
  size_t dimension = 0;
  for (const auto &document : documents) {
    std::vector<float> vector = embedder.get_embedding(document->text);
    if (vector.empty()) {
      throw DimensionMismatchError("Embedder returned an empty vector for document " +
                                   document->id);
    }
    if (dimension == 0) {
      dimension = vector.size();
    } else if (vector.size() != dimension) {
      throw DimensionMismatchError("Vector dimension mismatch for document " + document->id +
                                   ". Expected " + std::to_string(dimension) + ", got " +
                                   std::to_string(vector.size()));
    }
    entries.push_back({document, std::move(vector)});
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(entries.size() * dimension);
  for (const auto &entry : entries) {
    all_vectors_flat.insert(all_vectors_flat.end(), entry.vector.begin(), entry.vector.end());
  }

  auto faiss_index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension));
  // Labels are insertion positions, which the tie-break relies on
  faiss_index->add(static_cast<faiss::idx_t>(entries.size()), all_vectors_flat.data());

  entries_ = std::move(entries);
  faiss_index_ = std::move(faiss_index);
  dimension_ = dimension;
  embedding_model_id_ = embedder.model_id();

  std::cout << "Faiss index created with " << faiss_index_->ntotal << " vectors of dimension "
            << dimension_ << " (" << embedding_model_id_ << ")" << std::endl;
}

RetrievalResult EmbeddingIndex::search(const std::vector<float> &query_vector, size_t k) const {
  if (!faiss_index_) {
    throw EmptyIndexError("Index has not been built. Cannot perform search.");
  }
  if (k < 1) {
    throw std::invalid_argument("k must be at least 1");
  }
  if (query_vector.size() != dimension_) {
    throw EmbeddingMismatchError("Query vector dimension mismatch. Expected " +
                                 std::to_string(dimension_) + ", got " +
                                 std::to_string(query_vector.size()));
  }

  // Rank the whole corpus so equal distances at the cut-off are resolved by
  // insertion order rather than by Faiss's heap order
  const faiss::idx_t total = faiss_index_->ntotal;
  std::vector<float> distances(total);
  std::vector<faiss::idx_t> labels(total);
  faiss_index_->search(1, query_vector.data(), total, distances.data(), labels.data());

  std::vector<std::pair<float, faiss::idx_t>> ranked;
  ranked.reserve(total);
  for (faiss::idx_t i = 0; i < total; ++i) {
    if (labels[i] != -1) {
      ranked.emplace_back(distances[i], labels[i]);
    }
  }
  std::sort(ranked.begin(), ranked.end());

  const size_t actual_k = std::min(k, ranked.size());
  RetrievalResult result;
  result.hits.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    const auto &entry = entries_[static_cast<size_t>(ranked[i].second)];
    result.hits.push_back({entry.document, ranked[i].first});
  }
  return result;
}

}  // namespace voxrag_core
