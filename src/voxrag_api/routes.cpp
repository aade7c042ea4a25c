#include "voxrag_api/routes.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>

#include "voxrag_core/errors.hpp"
#include "voxrag_core/services/retriever.hpp"
#include "voxrag_core/services/session_manager.hpp"

namespace voxrag_api {

namespace {

std::string format_timestamp(const std::chrono::system_clock::time_point &tp) {
  std::time_t time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_utc{};
  gmtime_r(&time, &tm_utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return buffer;
}

}  // namespace

Routes::Routes(std::shared_ptr<voxrag_core::SessionManager> session_manager,
               std::shared_ptr<voxrag_core::Retriever> retriever)
    : session_manager_(session_manager), retriever_(retriever) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Session lifecycle
  CROW_ROUTE(app, "/sessions/<string>")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &id) {
        return handle_start_session(req, id);
      });

  CROW_ROUTE(app, "/sessions/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &id) {
        return handle_end_session(req, id);
      });

  CROW_ROUTE(app, "/sessions/<string>/history")
  ([this](const crow::request &req, const std::string &id) { return handle_get_history(req, id); });

  // Query endpoint
  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  // Retrieval only, no generation
  CROW_ROUTE(app, "/retrieve").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_retrieve(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("VoxRAG API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["active_sessions"] = session_manager_->session_count();
  return create_json_response(response);
}

crow::response Routes::handle_start_session(const crow::request &req,
                                            const std::string &session_id) {
  try {
    std::string welcome = session_manager_->start_session(session_id);
    nlohmann::json response = create_success_response("Session started");
    response["session_id"] = session_id;
    response["welcome"] = welcome;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_start_session: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_query(const crow::request &req) {
  std::string session_id;
  std::string query;
  try {
    auto json_body = parse_json_body(req.body);
    session_id = json_body.value("session_id", "");
    query = json_body.value("query", "");
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }
  if (session_id.empty()) {
    return create_json_response(create_error_response("session_id is required"), 400);
  }

  try {
    voxrag_core::QueryOutcome outcome = session_manager_->process_query(session_id, query);

    nlohmann::json response;
    response["response"] = outcome.response;
    response["state"] = voxrag_core::to_string(outcome.state);
    response["used_context"] = outcome.used_context;
    response["sources"] = sources_to_json(outcome.retrieval);
    if (outcome.error.has_value()) {
      response["error"] = *outcome.error;
    }
    return create_json_response(response);
  } catch (const voxrag_core::EmptyQueryError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_retrieve(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string query = json_body.value("query", "");
    int top_k = json_body.value("top_k", static_cast<int>(retriever_->default_top_k()));
    if (query.empty()) {
      return create_json_response(create_error_response("query is required"), 400);
    }
    if (top_k < 1) {
      return create_json_response(create_error_response("top_k must be at least 1"), 400);
    }

    std::cout << "Retrieve for: " << query << " with top_k: " << top_k << std::endl;
    voxrag_core::RetrievalResult result = retriever_->retrieve(query, static_cast<size_t>(top_k));

    nlohmann::json response;
    response["results"] = sources_to_json(result);
    return create_json_response(response);
  } catch (const std::exception &e) {
    nlohmann::json error_response = create_error_response(e.what());
    return create_json_response(error_response, 400);
  }
}

crow::response Routes::handle_get_history(const crow::request &req,
                                          const std::string &session_id) {
  if (!session_manager_->has_session(session_id)) {
    return create_json_response(create_error_response("Session not found"), 404);
  }
  nlohmann::json turns = nlohmann::json::array();
  for (const auto &turn : session_manager_->history(session_id)) {
    turns.push_back(turn_to_json(turn));
  }
  nlohmann::json response;
  response["session_id"] = session_id;
  response["turns"] = turns;
  return create_json_response(response);
}

crow::response Routes::handle_end_session(const crow::request &req,
                                          const std::string &session_id) {
  if (!session_manager_->end_session(session_id)) {
    return create_json_response(create_error_response("Session not found"), 404);
  }
  return create_json_response(create_success_response("Session ended"));
}

nlohmann::json Routes::sources_to_json(const voxrag_core::RetrievalResult &retrieval) {
  nlohmann::json sources = nlohmann::json::array();
  for (const auto &hit : retrieval.hits) {
    nlohmann::json source;
    source["id"] = hit.document->id;
    source["source"] = hit.document->source_path;
    source["score"] = hit.distance;
    source["text"] = hit.document->text;
    sources.push_back(source);
  }
  return sources;
}

nlohmann::json Routes::turn_to_json(const voxrag_core::ConversationTurn &turn) {
  nlohmann::json json_turn;
  json_turn["role"] = voxrag_core::to_string(turn.role);
  json_turn["text"] = turn.text;
  json_turn["timestamp"] = format_timestamp(turn.timestamp);
  return json_turn;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace voxrag_api
