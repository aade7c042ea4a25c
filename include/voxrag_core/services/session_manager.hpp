#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "voxrag_core/rag_context.hpp"
#include "voxrag_core/services/orchestrator.hpp"

namespace voxrag_core {

// Maps session ids to their Orchestrator. Sessions never share conversation state.
class SessionManager {
 public:
  explicit SessionManager(std::shared_ptr<const RagContext> context);

  // Creates the session if needed. Records and returns the welcome text when it
  // is configured and the session is new; otherwise returns an empty string.
  std::string start_session(const std::string &session_id);

  // Creates the session on first use. Throws EmptyQueryError for blank input.
  QueryOutcome process_query(const std::string &session_id, const std::string &query_text);

  // Empty for unknown sessions
  std::vector<ConversationTurn> history(const std::string &session_id) const;

  // Returns false if the session did not exist
  bool end_session(const std::string &session_id);

  // Ends every open session and returns how many there were
  size_t end_all_sessions();

  bool has_session(const std::string &session_id) const;
  size_t session_count() const;

 private:
  std::shared_ptr<Orchestrator> find_or_create(const std::string &session_id,
                                               bool record_welcome,
                                               bool &created);

  std::shared_ptr<const RagContext> context_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Orchestrator>> sessions_;
};

}  // namespace voxrag_core
