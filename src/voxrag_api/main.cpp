#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "voxrag_api/config.hpp"
#include "voxrag_api/routes.hpp"
#include "voxrag_api/server.hpp"
#include "voxrag_core/rag_context.hpp"
#include "voxrag_core/services/session_manager.hpp"

constexpr std::chrono::milliseconds SHUTDOWN_GRACE(5000);

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char *argv[]) {
  try {
    std::string config_path = argc > 1 ? argv[1] : "voxragrc.json";
    Config config = Config::from_file(config_path);
    const voxrag_core::RagOptions &options = config.rag;

    std::string server_url = config.api_base_url;
    std::cout << "Starting VoxRAG API Server..." << std::endl;
    std::cout << "Server URL: " << server_url << std::endl;
    std::cout << "Knowledge Base: " << options.knowledge_base_path << std::endl;
    std::cout << "Ollama URL: " << options.ollama_url << std::endl;
    std::cout << "Embedding Backend: " << voxrag_core::to_string(options.embedding_backend)
              << std::endl;
    std::cout << "Embedding Model: " << options.embedding_model << std::endl;
    std::cout << "Generation Model: " << options.generation_model << std::endl;

    // --- 1. BUILD THE KNOWLEDGE BASE (blocking, before any request) ---
    std::shared_ptr<voxrag_core::RagContext> context = voxrag_core::RagContext::build(options);
    auto session_manager = std::make_shared<voxrag_core::SessionManager>(context);

    std::string host = server_url.substr(0, server_url.find(':'));
    int port = std::stoi(server_url.substr(server_url.find(':') + 1));
    voxrag_api::Server server(host, port);
    voxrag_api::Routes routes(session_manager, context->retriever());
    routes.register_routes(server);

    // --- 2. START SERVING ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Closing open sessions..." << std::endl;
    size_t closed = session_manager->end_all_sessions();
    std::cout << "Closed " << closed << " session(s)." << std::endl;

    // Abandoned generation calls may still be inside the Ollama client
    std::shared_ptr<voxrag_core::BoundedGenerator> generator = context->generator();
    std::cout << "[3/3] Waiting for " << generator->in_flight() << " generation call(s)..."
              << std::endl;
    auto drain_timeout = std::chrono::milliseconds(options.generation_timeout_ms) + SHUTDOWN_GRACE;
    if (!generator->wait_until_idle(drain_timeout)) {
      std::cerr << "Warning: " << generator->in_flight()
                << " generation call(s) still running; exiting without cleanup" << std::endl;
      std::quick_exit(0);
    }

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
