#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "voxrag_core/extractors/content_extractor.hpp"
#include "voxrag_core/types/document.hpp"

namespace voxrag_core {

// Loads a corpus (a single file or a directory of files) into Documents.
// Output order and Document ids are a pure function of the files on disk.
class DocumentStore {
 public:
  explicit DocumentStore(ContentExtractorPtr extractor);

  // Throws LoadError if the path is missing, a source is unreadable or blank,
  // or a directory contains nothing loadable.
  std::vector<DocumentPtr> load(const std::filesystem::path &path) const;

  // Builds Documents from in-memory text attributed to source_path.
  std::vector<DocumentPtr> load_text(const std::string &text, const std::string &source_path) const;

 private:
  std::vector<DocumentPtr> make_documents(std::vector<Chunk> chunks,
                                          const std::string &source_path) const;
  std::vector<std::filesystem::path> list_sources(const std::filesystem::path &root) const;

  ContentExtractorPtr extractor_;
};

}  // namespace voxrag_core
