#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace voxrag_core {
class SessionManager;
class Retriever;
struct QueryOutcome;
struct RetrievalResult;
struct ConversationTurn;
}  // namespace voxrag_core

namespace voxrag_api {

class Routes {
 public:
  Routes(std::shared_ptr<voxrag_core::SessionManager> session_manager,
         std::shared_ptr<voxrag_core::Retriever> retriever);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Allow move constructor and assignment
  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_start_session(const crow::request &req, const std::string &session_id);
  crow::response handle_query(const crow::request &req);
  crow::response handle_retrieve(const crow::request &req);
  crow::response handle_get_history(const crow::request &req, const std::string &session_id);
  crow::response handle_end_session(const crow::request &req, const std::string &session_id);

 private:
  std::shared_ptr<voxrag_core::SessionManager> session_manager_;
  std::shared_ptr<voxrag_core::Retriever> retriever_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json sources_to_json(const voxrag_core::RetrievalResult &retrieval);
  nlohmann::json turn_to_json(const voxrag_core::ConversationTurn &turn);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace voxrag_api
