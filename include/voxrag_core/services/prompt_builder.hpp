#pragma once

#include <string>
#include <vector>

#include "voxrag_core/types.hpp"

namespace voxrag_core {

struct AssembledPrompt {
  std::string text;
  size_t documents_used = 0;
  size_t turns_used = 0;
  bool trimmed = false;
};

/**
 * @class PromptBuilder
 * @brief Assembles the generation prompt from retrieved context, recent
 * conversation turns and the current query.
 *
 * The result never exceeds the character budget (counted in UTF-8 bytes).
 * Overflow is resolved by shortening the last-ranked document first, then
 * dropping whole documents, then dropping the oldest turns. The query itself
 * is never shortened.
 */
class PromptBuilder {
 public:
  PromptBuilder(size_t char_budget, size_t turn_budget, size_t context_char_limit);

  // Throws PromptTooLargeError when the query plus scaffolding alone is over budget
  AssembledPrompt build(const RetrievalResult &retrieved,
                        const std::vector<ConversationTurn> &history,
                        const std::string &query) const;

 private:
  struct ContextBlock {
    std::string header;
    std::string body;
  };

  std::string render(const std::vector<ContextBlock> &contexts,
                     const std::vector<ConversationTurn> &turns,
                     const std::string &query) const;

  size_t char_budget_;
  size_t turn_budget_;
  size_t context_char_limit_;
};

}  // namespace voxrag_core
