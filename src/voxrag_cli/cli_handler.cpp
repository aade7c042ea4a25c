#include "voxrag_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision

namespace voxrag_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    options.command = Command::Help;
    options.top_k = 3;
    options.verbose = false;

    if (argc < 2) {
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
    } else if (command == "retrieve" || command == "r") {
        options.command = Command::Retrieve;
    } else if (command == "start") {
        options.command = Command::Start;
    } else if (command == "history") {
        options.command = Command::History;
    } else if (command == "end") {
        options.command = Command::End;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--verbose" || flag == "-v") {
            options.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--session" || flag == "-s") {
            options.session_id = value;
        } else if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--top-k" || flag == "-k") {
            try {
                options.top_k = std::stoi(value);
            } catch (const std::exception&) {
                throw CliError("--top-k expects a number, got: " + value);
            }
            if (options.top_k < 1) {
                throw CliError("--top-k must be at least 1");
            }
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    bool needs_session = options.command != Command::Retrieve;
    bool needs_query = options.command == Command::Ask || options.command == Command::Retrieve;
    if (needs_session && options.session_id.empty()) {
        throw CliError(command + " requires a session. Usage: " + command + " --session <id>");
    }
    if (needs_query && options.query.empty()) {
        throw CliError(command + " requires a query. Usage: " + command + " --query <text>");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Retrieve:
            handle_retrieve_command(options);
            break;
        case Command::Start:
            handle_start_command(options);
            break;
        case Command::History:
            handle_history_command(options);
            break;
        case Command::End:
            handle_end_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"session_id", options.session_id},
        {"query", options.query}
    };

    nlohmann::json response = make_post_request("/query", request_data);
    print_query_response(response, options.verbose);
}

void CliHandler::handle_retrieve_command(const CliOptions& options) {
    std::cout << "Retrieving for: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;

    nlohmann::json request_data = {
        {"query", options.query},
        {"top_k", options.top_k}
    };

    nlohmann::json response = make_post_request("/retrieve", request_data);
    print_retrieve_response(response);
}

void CliHandler::handle_start_command(const CliOptions& options) {
    nlohmann::json response =
        make_post_request("/sessions/" + encode_path_segment(options.session_id), nlohmann::json::object());
    std::string welcome = response.value("welcome", "");
    if (!welcome.empty()) {
        std::cout << "Agent: " << welcome << std::endl;
    } else {
        std::cout << "Session " << options.session_id << " is active." << std::endl;
    }
}

void CliHandler::handle_history_command(const CliOptions& options) {
    nlohmann::json response =
        make_get_request("/sessions/" + encode_path_segment(options.session_id) + "/history");
    print_history_response(response);
}

void CliHandler::handle_end_command(const CliOptions& options) {
    nlohmann::json response = make_delete_request("/sessions/" + encode_path_segment(options.session_id));
    print_json_response(response);
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform_request(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        nlohmann::json response = perform_request(endpoint);
        curl_slist_free_all(headers);
        return response;
    } catch (const std::exception&) {
        curl_slist_free_all(headers);
        throw;
    }
}

nlohmann::json CliHandler::make_delete_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
    return perform_request(endpoint);
}

// Runs the request configured on curl_handle_ and decodes the JSON reply
nlohmann::json CliHandler::perform_request(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        if (body.is_object() && body.contains("error")) {
            message += " (" + body["error"].get<std::string>() + ")";
        }
        throw CliError(message);
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_query_response(const nlohmann::json& response, bool verbose) {
    std::cout << "Agent: " << response.value("response", "") << std::endl;
    if (!verbose) {
        return;
    }

    std::cout << "\nState: " << response.value("state", "UNKNOWN")
              << " | Used context: " << (response.value("used_context", false) ? "yes" : "no") << std::endl;
    if (response.contains("error")) {
        std::cout << "Error: " << response["error"].get<std::string>() << std::endl;
    }
    if (response.contains("sources") && response["sources"].is_array()) {
        for (const auto& source : response["sources"]) {
            std::cout << "  - " << source["id"].get<std::string>()
                      << " (distance: " << std::fixed << std::setprecision(3) << source["score"].get<float>() << ")" << std::endl;
        }
    }
}

void CliHandler::print_retrieve_response(const nlohmann::json& response) {
    std::cout << "\n=== Retrieved Documents ===" << std::endl;

    if (!response.contains("results") || !response["results"].is_array() || response["results"].empty()) {
        std::cout << "No documents found." << std::endl;
        return;
    }

    int rank = 1;
    for (const auto& result : response["results"]) {
        std::cout << "  " << rank++ << ". " << result["id"].get<std::string>()
                  << " | Distance: " << std::fixed << std::setprecision(3) << result["score"].get<float>() << std::endl;
        std::string text = result.value("text", "");
        std::cout << "    Content: " << text.substr(0, 100);
        if (text.length() > 100) {
            std::cout << "...";
        }
        std::cout << std::endl << std::endl;
    }
}

void CliHandler::print_history_response(const nlohmann::json& response) {
    if (!response.contains("turns") || response["turns"].empty()) {
        std::cout << "No turns recorded." << std::endl;
        return;
    }
    for (const auto& turn : response["turns"]) {
        std::cout << "[" << turn.value("timestamp", "") << "] "
                  << turn.value("role", "") << ": " << turn.value("text", "") << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
VoxRAG CLI - Conversational assistant over a local knowledge base

Usage: voxrag_cli <command> [options]

Conversation Commands:
  start         Start a session and print the welcome message
    --session, -s <id>   Session identifier

  ask, a        Ask a question within a session
    --session, -s <id>   Session identifier
    --query, -q <text>   Question text
    --verbose, -v        Also print state and retrieved sources

  history       Show the turns recorded for a session
    --session, -s <id>   Session identifier

  end           End a session and discard its history
    --session, -s <id>   Session identifier

Knowledge Base Commands:
  retrieve, r   Show the documents closest to a query, without generation
    --query, -q <text>   Query text
    --top-k, -k <num>    Number of results to return (default: 3)

General:
  help, h       Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the VoxRAG API (default: http://127.0.0.1:3030)

Examples:
  voxrag_cli start --session caller-1
  voxrag_cli ask --session caller-1 --query "What are your business hours?"
  voxrag_cli retrieve --query "reset my password" --top-k 5
  voxrag_cli history --session caller-1
  voxrag_cli end --session caller-1
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

std::string CliHandler::encode_path_segment(const std::string& segment) {
    char* escaped = curl_easy_escape(curl_handle_, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) {
        throw CliError("Failed to encode: " + segment);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

}  // namespace voxrag_cli
