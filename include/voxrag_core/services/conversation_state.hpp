#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "voxrag_core/types/conversation.hpp"

namespace voxrag_core {

/**
 * @class ConversationState
 * @brief Append-only, ordered turn history for a single session.
 *
 * Concurrent requests reserve a slot when they arrive and commit their turns
 * when they finish. Committed turns become visible strictly in reservation
 * order, so history reflects arrival order regardless of completion order.
 */
class ConversationState {
 public:
  using Ticket = uint64_t;

  /**
   * @brief A reserved position in the history.
   *
   * Commit at most once. A reservation destroyed without a commit is released
   * so it never blocks later turns.
   */
  class Reservation {
   public:
    Reservation(ConversationState &state, Ticket ticket) : state_(&state), ticket_(ticket) {}
    Reservation(Reservation &&other) noexcept;
    Reservation &operator=(Reservation &&other) noexcept;
    Reservation(const Reservation &) = delete;
    Reservation &operator=(const Reservation &) = delete;
    ~Reservation();

    void commit(std::vector<ConversationTurn> turns);

    Ticket ticket() const {
      return ticket_;
    }

   private:
    void release() noexcept;

    ConversationState *state_;
    Ticket ticket_;
  };

  ConversationState() = default;

  // Non-copyable, non-movable: outstanding reservations point at this object
  ConversationState(const ConversationState &) = delete;
  ConversationState &operator=(const ConversationState &) = delete;
  ConversationState(ConversationState &&) = delete;
  ConversationState &operator=(ConversationState &&) = delete;

  Reservation reserve();

  // Reserve and commit one turn in a single step
  void append(ConversationRole role, const std::string &text);

  std::vector<ConversationTurn> history() const;
  std::vector<ConversationTurn> recent(size_t max_turns) const;
  size_t size() const;

  // Drops all turns. Reservations taken before the clear are discarded on commit.
  void clear();

  static ConversationTurn make_turn(ConversationRole role, const std::string &text);

 private:
  void commit(Ticket ticket, std::vector<ConversationTurn> turns);
  void flush_ready_locked();

  mutable std::mutex mutex_;
  std::vector<ConversationTurn> turns_;
  std::map<Ticket, std::vector<ConversationTurn>> pending_;
  Ticket next_ticket_ = 0;
  Ticket next_to_flush_ = 0;
};

}  // namespace voxrag_core
