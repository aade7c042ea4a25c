#include "voxrag_core/llm/hashing_embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace voxrag_core {

namespace {

uint32_t fnv1a(const std::string &token) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : token) {
    hash ^= c;
    hash *= 16777619u;
  }
  return hash;
}

}  // namespace

HashingEmbedder::HashingEmbedder(size_t dimensions) : dimensions_(dimensions) {
  if (dimensions_ == 0) {
    throw std::invalid_argument("HashingEmbedder dimensions must be greater than 0");
  }
}

std::string HashingEmbedder::model_id() const {
  return "hashing-" + std::to_string(dimensions_);
}

std::vector<std::string> HashingEmbedder::tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::vector<float> HashingEmbedder::get_embedding(const std::string &text) {
  std::vector<float> embedding(dimensions_, 0.0f);
  for (const auto &token : tokenize(text)) {
    embedding[fnv1a(token) % dimensions_] += 1.0f;
  }

  double norm = 0.0;
  for (float v : embedding) {
    norm += static_cast<double>(v) * v;
  }
  // Text without tokens stays the zero vector
  if (norm > 0.0) {
    const float inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float &v : embedding) {
      v *= inv;
    }
  }
  return embedding;
}

}  // namespace voxrag_core
