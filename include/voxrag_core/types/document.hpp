#pragma once

#include <memory>
#include <string>
#include <vector>

namespace voxrag_core {

// One addressable chunk of a source file. Never modified after loading.
struct Document {
  std::string id;           // "<relative source path>#<chunk index>"
  std::string source_path;  // relative to the corpus root
  std::string text;
  int chunk_index = 0;
  std::string content_hash;  // sha256 of text
};

using DocumentPtr = std::shared_ptr<const Document>;

struct RetrievedDocument {
  DocumentPtr document;
  float distance;
};

// Ranked by ascending squared L2 distance. Never contains a document twice.
struct RetrievalResult {
  std::vector<RetrievedDocument> hits;

  bool empty() const {
    return hits.empty();
  }
  size_t size() const {
    return hits.size();
  }
  std::vector<float> scores() const;
};

}  // namespace voxrag_core
