#pragma once

#include <chrono>
#include <string>

namespace voxrag_core {

enum class ConversationRole { User, Agent, System };

std::string to_string(ConversationRole role);
ConversationRole conversation_role_from_string(const std::string &str);

struct ConversationTurn {
  ConversationRole role;
  std::string text;
  std::chrono::system_clock::time_point timestamp;
};

}  // namespace voxrag_core
