#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "voxrag_core/llm/response_generator.hpp"

namespace voxrag_core {

enum class GenerationStatus { Success, Timeout, Rejected, Unavailable };

std::string to_string(GenerationStatus status);

struct GenerationOutcome {
  GenerationStatus status = GenerationStatus::Unavailable;
  std::string text;   // set on Success
  std::string error;  // set otherwise

  bool ok() const {
    return status == GenerationStatus::Success;
  }
};

/**
 * @class BoundedGenerator
 * @brief Runs exactly one generation call under a deadline.
 *
 * The call executes on its own thread. If it has not finished when the
 * deadline passes, run() returns a Timeout outcome immediately and the call is
 * abandoned; it keeps the generator alive until it returns on its own.
 *
 * Calls still running are counted. Once `max_in_flight` are outstanding, new
 * calls are refused as Unavailable without starting a thread. Shutdown code
 * waits for the count to drain with wait_until_idle().
 */
class BoundedGenerator {
 public:
  static constexpr size_t DEFAULT_MAX_IN_FLIGHT = 32;

  explicit BoundedGenerator(std::shared_ptr<ResponseGenerator> generator,
                            size_t max_in_flight = DEFAULT_MAX_IN_FLIGHT);

  GenerationOutcome run(const std::string &prompt,
                        const GenerationOptions &options,
                        std::chrono::milliseconds timeout) const;

  // Calls started and not yet returned, including abandoned ones
  size_t in_flight() const;

  // Returns true if no call is running when it returns
  bool wait_until_idle(std::chrono::milliseconds timeout) const;

 private:
  struct Workers {
    std::mutex mutex;
    std::condition_variable idle;
    size_t in_flight = 0;
  };

  std::shared_ptr<ResponseGenerator> generator_;
  size_t max_in_flight_;
  // Shared with running calls so they can check out after this object is gone
  std::shared_ptr<Workers> workers_;
};

}  // namespace voxrag_core
