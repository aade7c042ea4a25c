#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voxrag_core/llm/bounded_generator.hpp"
#include "voxrag_core/rag_options.hpp"
#include "voxrag_core/services/conversation_state.hpp"
#include "voxrag_core/services/prompt_builder.hpp"
#include "voxrag_core/services/retriever.hpp"

namespace voxrag_core {

enum class QueryState { Idle, Retrieving, Generating, Complete, Failed };

std::string to_string(QueryState state);

// Per-request record of what happened to one query
struct QueryOutcome {
  std::string response;
  QueryState state = QueryState::Idle;
  RetrievalResult retrieval;
  bool used_context = false;
  std::optional<GenerationStatus> generation_status;
  std::optional<std::string> error;
};

/**
 * @class Orchestrator
 * @brief Drives one session's queries through retrieval, prompt assembly and
 * bounded generation.
 *
 * Every well-formed query gets either a generated answer or the fallback text.
 * Per-request failures are logged and counted, never thrown.
 */
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<Retriever> retriever,
               std::shared_ptr<ResponseGenerator> generator,
               const RagOptions &options);

  // Shares `generator` (and its in-flight limit) with other orchestrators
  Orchestrator(std::shared_ptr<Retriever> retriever,
               std::shared_ptr<BoundedGenerator> generator,
               const RagOptions &options);

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // Returns the response text. Throws EmptyQueryError for blank input.
  std::string process_query(const std::string &query_text);

  // Same as process_query, with the full outcome
  QueryOutcome process_query_detailed(const std::string &query_text);

  // Records a system turn, e.g. the welcome message
  void add_system_turn(const std::string &text);

  std::vector<ConversationTurn> history() const {
    return conversation_.history();
  }

  void clear() {
    conversation_.clear();
  }

  size_t failure_count() const {
    return failure_count_.load();
  }

  std::optional<std::string> last_failure() const;

 private:
  void record_failure(QueryOutcome &outcome, const std::string &message);
  std::string fallback_for(const RetrievalResult &retrieval) const;

  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<BoundedGenerator> generator_;
  PromptBuilder prompt_builder_;
  RagOptions options_;
  ConversationState conversation_;

  std::atomic<size_t> failure_count_{0};
  mutable std::mutex failure_mutex_;
  std::optional<std::string> last_failure_;
};

}  // namespace voxrag_core
