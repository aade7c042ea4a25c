#pragma once

#include <string>

namespace voxrag_core {

struct Chunk {
  std::string content;
  int chunk_index;
};

}  // namespace voxrag_core
