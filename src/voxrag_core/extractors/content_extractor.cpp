#include "voxrag_core/extractors/content_extractor.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "voxrag_core/errors.hpp"

namespace voxrag_core {

ContentExtractor::ContentExtractor(size_t max_chunk_chars) : max_chunk_chars_(max_chunk_chars) {
  if (max_chunk_chars_ == 0) {
    throw std::invalid_argument("max_chunk_chars must be greater than 0");
  }
}

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw LoadError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw LoadError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

void ContentExtractor::validate_utf8(const std::string& text) {
  auto invalid = utf8::find_invalid(text.begin(), text.end());
  if (invalid != text.end()) {
    throw LoadError("Source text is not valid UTF-8 at byte " +
                    std::to_string(invalid - text.begin()));
  }
}

std::vector<Chunk> ContentExtractor::get_chunks(const fs::path& file_path) const {
  return chunk_text(get_string_content(file_path));
}

std::string ContentExtractor::compute_hash_from_content(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

std::vector<std::string> ContentExtractor::split_into_fixed_chunks(const std::string& text) const {
  std::vector<std::string> out;
  if (text.empty())
    return out;

  auto chunk_start = text.begin();
  try {
    for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
      if (static_cast<size_t>(it - chunk_start) >= max_chunk_chars_) {
        out.emplace_back(chunk_start, it);  // up to, but *not* including it
        chunk_start = it;
      }
    }
  } catch (const utf8::exception& e) {
    throw LoadError("Source text is not valid UTF-8: " + std::string(e.what()));
  }
  // last chunk
  if (chunk_start != text.end())
    out.emplace_back(chunk_start, text.end());

  return out;
}

}  // namespace voxrag_core
