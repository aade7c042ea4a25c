#include "voxrag_core/services/conversation_state.hpp"

#include <iostream>
#include <stdexcept>

namespace voxrag_core {

ConversationState::Reservation::Reservation(Reservation &&other) noexcept
    : state_(other.state_), ticket_(other.ticket_) {
  other.state_ = nullptr;
}

ConversationState::Reservation &ConversationState::Reservation::operator=(
    Reservation &&other) noexcept {
  if (this != &other) {
    release();
    state_ = other.state_;
    ticket_ = other.ticket_;
    other.state_ = nullptr;
  }
  return *this;
}

ConversationState::Reservation::~Reservation() {
  release();
}

void ConversationState::Reservation::release() noexcept {
  if (!state_) {
    return;
  }
  try {
    state_->commit(ticket_, {});
  } catch (const std::exception &e) {
    std::cerr << "Warning: failed to release conversation slot " << ticket_ << ": " << e.what()
              << std::endl;
  }
  state_ = nullptr;
}

void ConversationState::Reservation::commit(std::vector<ConversationTurn> turns) {
  if (!state_) {
    throw std::logic_error("Reservation already committed");
  }
  ConversationState *state = state_;
  state_ = nullptr;
  state->commit(ticket_, std::move(turns));
}

ConversationTurn ConversationState::make_turn(ConversationRole role, const std::string &text) {
  return {role, text, std::chrono::system_clock::now()};
}

ConversationState::Reservation ConversationState::reserve() {
  std::lock_guard<std::mutex> lock(mutex_);
  return Reservation(*this, next_ticket_++);
}

void ConversationState::append(ConversationRole role, const std::string &text) {
  reserve().commit({make_turn(role, text)});
}

void ConversationState::commit(Ticket ticket, std::vector<ConversationTurn> turns) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ticket < next_to_flush_) {
    // Reserved before a clear()
    return;
  }
  pending_[ticket] = std::move(turns);
  flush_ready_locked();
}

void ConversationState::flush_ready_locked() {
  auto it = pending_.begin();
  while (it != pending_.end() && it->first == next_to_flush_) {
    for (auto &turn : it->second) {
      turns_.push_back(std::move(turn));
    }
    it = pending_.erase(it);
    ++next_to_flush_;
  }
}

std::vector<ConversationTurn> ConversationState::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return turns_;
}

std::vector<ConversationTurn> ConversationState::recent(size_t max_turns) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t first = turns_.size() > max_turns ? turns_.size() - max_turns : 0;
  return std::vector<ConversationTurn>(turns_.begin() + static_cast<std::ptrdiff_t>(first),
                                       turns_.end());
}

size_t ConversationState::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return turns_.size();
}

void ConversationState::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  turns_.clear();
  pending_.clear();
  next_to_flush_ = next_ticket_;
}

}  // namespace voxrag_core
