#pragma once

#include <string>
#include <vector>

#include "voxrag_core/llm/embedder.hpp"

namespace voxrag_core {

// Local, deterministic bag-of-words embedder. Each lower-cased alphanumeric
// token is hashed (FNV-1a) into one of `dimensions` buckets and the counts
// are L2-normalised. Needs no server, so it backs offline runs and tests.
class HashingEmbedder : public Embedder {
 public:
  explicit HashingEmbedder(size_t dimensions = 384);

  std::string model_id() const override;
  std::vector<float> get_embedding(const std::string &text) override;

  size_t dimensions() const {
    return dimensions_;
  }

  static std::vector<std::string> tokenize(const std::string &text);

 private:
  size_t dimensions_;
};

}  // namespace voxrag_core
