#include "voxrag_core/services/orchestrator.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "voxrag_core/errors.hpp"
#include "voxrag_core/text_utils.hpp"

namespace voxrag_core {

namespace {

constexpr size_t CONTEXTUAL_FALLBACK_CHARS = 200;

}  // namespace

std::string to_string(QueryState state) {
  switch (state) {
    case QueryState::Idle:
      return "IDLE";
    case QueryState::Retrieving:
      return "RETRIEVING";
    case QueryState::Generating:
      return "GENERATING";
    case QueryState::Complete:
      return "COMPLETE";
    case QueryState::Failed:
      return "FAILED";
    default:
      return "UNKNOWN";
  }
}

Orchestrator::Orchestrator(std::shared_ptr<Retriever> retriever,
                           std::shared_ptr<ResponseGenerator> generator,
                           const RagOptions &options)
    : Orchestrator(std::move(retriever),
                   std::make_shared<BoundedGenerator>(std::move(generator)),
                   options) {}

Orchestrator::Orchestrator(std::shared_ptr<Retriever> retriever,
                           std::shared_ptr<BoundedGenerator> generator,
                           const RagOptions &options)
    : retriever_(std::move(retriever)),
      generator_(std::move(generator)),
      prompt_builder_(static_cast<size_t>(options.prompt_char_budget),
                      static_cast<size_t>(options.conversation_turn_budget),
                      static_cast<size_t>(options.context_char_limit)),
      options_(options) {
  if (!retriever_) {
    throw std::invalid_argument("Orchestrator requires a retriever");
  }
  if (!generator_) {
    throw std::invalid_argument("Orchestrator requires a generator");
  }
}

std::string Orchestrator::process_query(const std::string &query_text) {
  return process_query_detailed(query_text).response;
}

QueryOutcome Orchestrator::process_query_detailed(const std::string &query_text) {
  if (text::is_blank(query_text)) {
    throw EmptyQueryError("Query text is empty");
  }

  // Taken on arrival so this call's turns land in arrival order
  ConversationState::Reservation slot = conversation_.reserve();
  const ConversationTurn user_turn =
      ConversationState::make_turn(ConversationRole::User, query_text);
  std::vector<ConversationTurn> recent_turns =
      conversation_.recent(static_cast<size_t>(options_.conversation_turn_budget));

  QueryOutcome outcome;
  outcome.state = QueryState::Retrieving;
  std::cout << "Query: " << query_text << std::endl;

  try {
    outcome.retrieval = retriever_->retrieve(query_text, static_cast<size_t>(options_.top_k));
  } catch (const std::exception &e) {
    record_failure(outcome, std::string("Retrieval failed: ") + e.what());
    outcome.response = fallback_for(outcome.retrieval);
    slot.commit({user_turn});
    return outcome;
  }

  for (const auto &hit : outcome.retrieval.hits) {
    std::cout << "  Retrieved " << hit.document->id << " (distance " << hit.distance << ")"
              << std::endl;
  }

  outcome.state = QueryState::Generating;
  try {
    AssembledPrompt prompt = prompt_builder_.build(outcome.retrieval, recent_turns, query_text);
    outcome.used_context = prompt.documents_used > 0;

    GenerationOutcome generated;
    try {
      generated = generator_->run(prompt.text, options_.generation,
                                  std::chrono::milliseconds(options_.generation_timeout_ms));
    } catch (const std::exception &e) {
      generated.status = GenerationStatus::Unavailable;
      generated.error = e.what();
    }
    outcome.generation_status = generated.status;

    std::string answer = generated.ok() ? text::trim(generated.text) : "";
    if (!generated.ok()) {
      record_failure(outcome, "Generation " + to_string(generated.status) + ": " + generated.error);
    } else if (answer.empty()) {
      outcome.generation_status = GenerationStatus::Rejected;
      record_failure(outcome, "Generation returned only whitespace");
    } else {
      outcome.response = answer;
      outcome.state = QueryState::Complete;
      slot.commit({user_turn, ConversationState::make_turn(ConversationRole::Agent, answer)});
      return outcome;
    }
  } catch (const PromptTooLargeError &e) {
    record_failure(outcome, e.what());
  }

  outcome.response = fallback_for(outcome.retrieval);
  slot.commit({user_turn});
  return outcome;
}

void Orchestrator::add_system_turn(const std::string &text) {
  conversation_.append(ConversationRole::System, text);
}

std::optional<std::string> Orchestrator::last_failure() const {
  std::lock_guard<std::mutex> lock(failure_mutex_);
  return last_failure_;
}

void Orchestrator::record_failure(QueryOutcome &outcome, const std::string &message) {
  outcome.state = QueryState::Failed;
  outcome.error = message;
  ++failure_count_;
  {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    last_failure_ = message;
  }
  std::cerr << "Query failed, using fallback: " << message << std::endl;
}

std::string Orchestrator::fallback_for(const RetrievalResult &retrieval) const {
  if (!options_.contextual_fallback || retrieval.empty()) {
    return options_.fallback_response_text;
  }

  std::string summary =
      text::trim(text::utf8_prefix(retrieval.hits.front().document->text, CONTEXTUAL_FALLBACK_CHARS));
  // Keep whole sentences only
  const auto last_period = summary.rfind('.');
  if (last_period != std::string::npos) {
    summary = summary.substr(0, last_period + 1);
  }
  return summary.empty() ? options_.fallback_response_text : summary;
}

}  // namespace voxrag_core
