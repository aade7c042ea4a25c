#pragma once

#include <string>
#include <vector>

namespace voxrag_core {

// Text -> fixed-dimension vector. The same Embedder (same model_id) must be
// used to build an index and to embed queries against it.
class Embedder {
 public:
  virtual ~Embedder() = default;

  // Identifies the embedding model; indexes record it at build time.
  virtual std::string model_id() const = 0;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;
};

}  // namespace voxrag_core
