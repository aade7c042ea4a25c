#include "voxrag_core/services/session_manager.hpp"

#include <iostream>
#include <stdexcept>

#include "voxrag_core/errors.hpp"
#include "voxrag_core/text_utils.hpp"

namespace voxrag_core {

SessionManager::SessionManager(std::shared_ptr<const RagContext> context)
    : context_(std::move(context)) {
  if (!context_) {
    throw std::invalid_argument("SessionManager requires a RAG context");
  }
}

std::shared_ptr<Orchestrator> SessionManager::find_or_create(const std::string &session_id,
                                                             bool record_welcome,
                                                             bool &created) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    created = false;
    return it->second;
  }
  std::shared_ptr<Orchestrator> orchestrator = context_->make_orchestrator();
  // Recorded before the session is visible so it is always the first turn
  const std::string &welcome = context_->options().welcome_text;
  if (record_welcome && !text::is_blank(welcome)) {
    orchestrator->add_system_turn(welcome);
  }
  sessions_.emplace(session_id, orchestrator);
  created = true;
  std::cout << "Session started: " << session_id << std::endl;
  return orchestrator;
}

std::string SessionManager::start_session(const std::string &session_id) {
  bool created = false;
  find_or_create(session_id, true, created);

  const std::string &welcome = context_->options().welcome_text;
  if (!created || text::is_blank(welcome)) {
    return "";
  }
  return welcome;
}

QueryOutcome SessionManager::process_query(const std::string &session_id,
                                           const std::string &query_text) {
  // Reject before a session is created for a malformed call
  if (text::is_blank(query_text)) {
    throw EmptyQueryError("Query text is empty");
  }
  bool created = false;
  std::shared_ptr<Orchestrator> orchestrator = find_or_create(session_id, false, created);
  return orchestrator->process_query_detailed(query_text);
}

std::vector<ConversationTurn> SessionManager::history(const std::string &session_id) const {
  std::shared_ptr<Orchestrator> orchestrator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return {};
    }
    orchestrator = it->second;
  }
  return orchestrator->history();
}

bool SessionManager::end_session(const std::string &session_id) {
  std::shared_ptr<Orchestrator> orchestrator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    orchestrator = std::move(it->second);
    sessions_.erase(it);
  }
  orchestrator->clear();
  std::cout << "Session ended: " << session_id << std::endl;
  return true;
}

size_t SessionManager::end_all_sessions() {
  std::map<std::string, std::shared_ptr<Orchestrator>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.swap(sessions_);
  }
  for (auto &[session_id, orchestrator] : sessions) {
    orchestrator->clear();
    std::cout << "Session ended: " << session_id << std::endl;
  }
  return sessions.size();
}

bool SessionManager::has_session(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(session_id) > 0;
}

size_t SessionManager::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace voxrag_core
