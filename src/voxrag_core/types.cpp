#include "voxrag_core/types.hpp"

#include <stdexcept>

namespace voxrag_core {

std::string to_string(ConversationRole role) {
  switch (role) {
    case ConversationRole::User:
      return "user";
    case ConversationRole::Agent:
      return "agent";
    case ConversationRole::System:
      return "system";
    default:
      return "unknown";
  }
}

ConversationRole conversation_role_from_string(const std::string &str) {
  if (str == "user")
    return ConversationRole::User;
  if (str == "agent")
    return ConversationRole::Agent;
  if (str == "system")
    return ConversationRole::System;
  throw std::invalid_argument("Unknown ConversationRole: " + str);
}

std::vector<float> RetrievalResult::scores() const {
  std::vector<float> out;
  out.reserve(hits.size());
  for (const auto &hit : hits) {
    out.push_back(hit.distance);
  }
  return out;
}

}  // namespace voxrag_core
