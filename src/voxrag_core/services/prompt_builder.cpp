#include "voxrag_core/services/prompt_builder.hpp"

#include <sstream>
#include <stdexcept>

#include "voxrag_core/errors.hpp"
#include "voxrag_core/text_utils.hpp"

namespace voxrag_core {

namespace {

constexpr const char *CONTEXT_HEADING = "Context:";
constexpr const char *CONVERSATION_HEADING = "Conversation:";
constexpr const char *QUESTION_PREFIX = "Question: ";
constexpr const char *ANSWER_SUFFIX = "\n\nAnswer briefly:";
constexpr const char *SECTION_SEPARATOR = "\n\n";

}  // namespace

PromptBuilder::PromptBuilder(size_t char_budget, size_t turn_budget, size_t context_char_limit)
    : char_budget_(char_budget), turn_budget_(turn_budget), context_char_limit_(context_char_limit) {
  if (char_budget_ == 0) {
    throw std::invalid_argument("char_budget must be greater than 0");
  }
  if (context_char_limit_ == 0) {
    throw std::invalid_argument("context_char_limit must be greater than 0");
  }
}

std::string PromptBuilder::render(const std::vector<ContextBlock> &contexts,
                                  const std::vector<ConversationTurn> &turns,
                                  const std::string &query) const {
  std::stringstream ss;

  if (!contexts.empty()) {
    ss << CONTEXT_HEADING << "\n";
    for (size_t i = 0; i < contexts.size(); ++i) {
      if (i > 0) {
        ss << SECTION_SEPARATOR;
      }
      ss << contexts[i].header << "\n" << contexts[i].body;
    }
    ss << SECTION_SEPARATOR;
  }

  if (!turns.empty()) {
    ss << CONVERSATION_HEADING << "\n";
    for (size_t i = 0; i < turns.size(); ++i) {
      if (i > 0) {
        ss << "\n";
      }
      ss << to_string(turns[i].role) << ": " << turns[i].text;
    }
    ss << SECTION_SEPARATOR;
  }

  ss << QUESTION_PREFIX << query << ANSWER_SUFFIX;
  return ss.str();
}

AssembledPrompt PromptBuilder::build(const RetrievalResult &retrieved,
                                     const std::vector<ConversationTurn> &history,
                                     const std::string &query) const {
  const std::string minimal = render({}, {}, query);
  if (minimal.size() > char_budget_) {
    throw PromptTooLargeError("Query needs " + std::to_string(minimal.size()) +
                              " characters but the prompt budget is " +
                              std::to_string(char_budget_));
  }

  std::vector<ContextBlock> contexts;
  contexts.reserve(retrieved.hits.size());
  for (size_t i = 0; i < retrieved.hits.size(); ++i) {
    const auto &document = *retrieved.hits[i].document;
    contexts.push_back({"[Source " + std::to_string(i + 1) + ": " + document.source_path + "]",
                        text::utf8_prefix(document.text, context_char_limit_)});
  }

  // Most recent turns only, kept in chronological order
  const size_t first_turn = history.size() > turn_budget_ ? history.size() - turn_budget_ : 0;
  std::vector<ConversationTurn> turns(history.begin() + static_cast<std::ptrdiff_t>(first_turn),
                                      history.end());

  AssembledPrompt prompt;
  std::string text = render(contexts, turns, query);
  while (text.size() > char_budget_) {
    prompt.trimmed = true;
    if (!contexts.empty()) {
      ContextBlock &last = contexts.back();
      const size_t overflow = text.size() - char_budget_;
      if (last.body.size() > overflow) {
        last.body = text::utf8_prefix(last.body, last.body.size() - overflow);
      } else {
        last.body.clear();
      }
      if (last.body.empty()) {
        contexts.pop_back();
      }
    } else if (!turns.empty()) {
      turns.erase(turns.begin());
    } else {
      // Unreachable: the minimal prompt fits
      break;
    }
    text = render(contexts, turns, query);
  }

  prompt.text = std::move(text);
  prompt.documents_used = contexts.size();
  prompt.turns_used = turns.size();
  return prompt;
}

}  // namespace voxrag_core
