#pragma once

#include <string>

#include "voxrag_core/rag_options.hpp"

namespace voxrag_core {

// Contract around an external text-generation capability.
class ResponseGenerator {
 public:
  virtual ~ResponseGenerator() = default;

  // Returns the generated text. Throws GenerationUnavailableError,
  // GenerationRejectedError or GenerationTimeoutError. Not idempotent:
  // repeated calls may return different text.
  virtual std::string generate(const std::string &prompt, const GenerationOptions &options) = 0;
};

}  // namespace voxrag_core
