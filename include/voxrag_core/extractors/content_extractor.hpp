#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "voxrag_core/types/chunk.hpp"

namespace fs = std::filesystem;

namespace voxrag_core {

class ContentExtractor {
 public:
  explicit ContentExtractor(size_t max_chunk_chars = DEFAULT_MAX_CHUNK_CHARS);
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // opens, reads, and chunks the file
  virtual std::vector<Chunk> get_chunks(const fs::path& file_path) const;

  // Chunks already-loaded text. Must be a pure function of its input.
  virtual std::vector<Chunk> chunk_text(const std::string& text) const = 0;

  // Hex-encoded SHA-256 of the content
  static std::string compute_hash_from_content(const std::string& content);

  static constexpr size_t DEFAULT_MAX_CHUNK_CHARS = 500;

 protected:
  std::string get_string_content(const fs::path& file_path) const;

  // Throws LoadError at the first byte that is not valid UTF-8
  static void validate_utf8(const std::string& text);

  // Fixed-size fallback for sections longer than max_chunk_chars_.
  // Cuts only on UTF-8 code point boundaries.
  std::vector<std::string> split_into_fixed_chunks(const std::string& text) const;

  size_t max_chunk_chars_;
};

using ContentExtractorPtr = std::shared_ptr<ContentExtractor>;

}  // namespace voxrag_core
