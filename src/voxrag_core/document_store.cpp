#include "voxrag_core/document_store.hpp"

#include <algorithm>
#include <iostream>

#include "voxrag_core/errors.hpp"

namespace voxrag_core {

DocumentStore::DocumentStore(ContentExtractorPtr extractor) : extractor_(std::move(extractor)) {
  if (!extractor_) {
    throw std::invalid_argument("DocumentStore requires a content extractor");
  }
}

std::vector<DocumentPtr> DocumentStore::load(const std::filesystem::path &path) const {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw LoadError("Knowledge base path not found: " + path.string());
  }

  std::vector<DocumentPtr> documents;
  if (std::filesystem::is_directory(path, ec)) {
    for (const auto &source : list_sources(path)) {
      auto chunks = extractor_->get_chunks(source);
      if (chunks.empty()) {
        throw LoadError("Source is empty: " + source.string());
      }
      auto docs = make_documents(std::move(chunks), source.lexically_relative(path).generic_string());
      documents.insert(documents.end(), docs.begin(), docs.end());
    }
  } else {
    auto chunks = extractor_->get_chunks(path);
    if (chunks.empty()) {
      throw LoadError("Source is empty: " + path.string());
    }
    documents = make_documents(std::move(chunks), path.filename().generic_string());
  }

  std::cout << "Loaded " << documents.size() << " document chunks from " << path.string()
            << std::endl;
  return documents;
}

std::vector<DocumentPtr> DocumentStore::load_text(const std::string &text,
                                                  const std::string &source_path) const {
  auto chunks = extractor_->chunk_text(text);
  if (chunks.empty()) {
    throw LoadError("Source is empty: " + source_path);
  }

  return make_documents(std::move(chunks), source_path);
}

std::vector<DocumentPtr> DocumentStore::make_documents(std::vector<Chunk> chunks,
                                                       const std::string &source_path) const {
  std::vector<DocumentPtr> documents;
  documents.reserve(chunks.size());
  for (auto &chunk : chunks) {
    auto doc = std::make_shared<Document>();
    doc->id = source_path + "#" + std::to_string(chunk.chunk_index);
    doc->source_path = source_path;
    doc->chunk_index = chunk.chunk_index;
    doc->content_hash = ContentExtractor::compute_hash_from_content(chunk.content);
    doc->text = std::move(chunk.content);
    documents.push_back(std::move(doc));
  }
  return documents;
}

std::vector<std::filesystem::path> DocumentStore::list_sources(
    const std::filesystem::path &root) const {
  std::vector<std::filesystem::path> sources;
  try {
    for (const auto &entry : std::filesystem::recursive_directory_iterator(root)) {
      if (entry.is_regular_file() && extractor_->can_handle(entry.path())) {
        sources.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw LoadError("Could not read knowledge base directory " + root.string() + ": " + e.what());
  }
  if (sources.empty()) {
    throw LoadError("No loadable sources found in " + root.string());
  }
  // Directory iteration order is unspecified; sort so ids are stable across runs
  std::sort(sources.begin(), sources.end(),
            [&root](const std::filesystem::path &a, const std::filesystem::path &b) {
              return a.lexically_relative(root).generic_string() <
                     b.lexically_relative(root).generic_string();
            });
  return sources;
}

}  // namespace voxrag_core
