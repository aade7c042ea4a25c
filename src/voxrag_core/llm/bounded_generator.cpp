#include "voxrag_core/llm/bounded_generator.hpp"

#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "voxrag_core/errors.hpp"

namespace voxrag_core {

namespace {

GenerationOutcome invoke(ResponseGenerator &generator,
                         const std::string &prompt,
                         const GenerationOptions &options) {
  GenerationOutcome outcome;
  try {
    outcome.text = generator.generate(prompt, options);
    outcome.status = GenerationStatus::Success;
  } catch (const GenerationTimeoutError &e) {
    outcome.status = GenerationStatus::Timeout;
    outcome.error = e.what();
  } catch (const GenerationRejectedError &e) {
    outcome.status = GenerationStatus::Rejected;
    outcome.error = e.what();
  } catch (const GenerationUnavailableError &e) {
    outcome.status = GenerationStatus::Unavailable;
    outcome.error = e.what();
  } catch (const std::exception &e) {
    // Anything else from the capability means it is not usable right now
    outcome.status = GenerationStatus::Unavailable;
    outcome.error = e.what();
  }
  return outcome;
}

}  // namespace

std::string to_string(GenerationStatus status) {
  switch (status) {
    case GenerationStatus::Success:
      return "SUCCESS";
    case GenerationStatus::Timeout:
      return "TIMEOUT";
    case GenerationStatus::Rejected:
      return "REJECTED";
    case GenerationStatus::Unavailable:
      return "UNAVAILABLE";
    default:
      return "UNKNOWN";
  }
}

BoundedGenerator::BoundedGenerator(std::shared_ptr<ResponseGenerator> generator,
                                   size_t max_in_flight)
    : generator_(std::move(generator)),
      max_in_flight_(max_in_flight),
      workers_(std::make_shared<Workers>()) {
  if (!generator_) {
    throw std::invalid_argument("BoundedGenerator requires a response generator");
  }
  if (max_in_flight_ == 0) {
    throw std::invalid_argument("max_in_flight must be at least 1");
  }
}

GenerationOutcome BoundedGenerator::run(const std::string &prompt,
                                        const GenerationOptions &options,
                                        std::chrono::milliseconds timeout) const {
  {
    std::lock_guard<std::mutex> lock(workers_->mutex);
    if (workers_->in_flight >= max_in_flight_) {
      GenerationOutcome outcome;
      outcome.status = GenerationStatus::Unavailable;
      outcome.error = "Too many generation calls in flight (" +
                      std::to_string(workers_->in_flight) + ")";
      return outcome;
    }
    ++workers_->in_flight;
  }

  auto promise = std::make_shared<std::promise<GenerationOutcome>>();
  std::future<GenerationOutcome> future = promise->get_future();

  try {
    std::thread([generator = generator_, workers = workers_, promise, prompt, options]() mutable {
      GenerationOutcome outcome = invoke(*generator, prompt, options);
      // Drop our reference before publishing so a finished call never outlives
      // the caller's view of the generator
      generator.reset();
      promise->set_value(std::move(outcome));

      std::lock_guard<std::mutex> lock(workers->mutex);
      --workers->in_flight;
      workers->idle.notify_all();
    }).detach();
  } catch (const std::system_error &e) {
    {
      std::lock_guard<std::mutex> lock(workers_->mutex);
      --workers_->in_flight;
    }
    workers_->idle.notify_all();
    GenerationOutcome outcome;
    outcome.status = GenerationStatus::Unavailable;
    outcome.error = std::string("Could not start generation thread: ") + e.what();
    return outcome;
  }

  if (future.wait_for(timeout) == std::future_status::timeout) {
    GenerationOutcome outcome;
    outcome.status = GenerationStatus::Timeout;
    outcome.error = "Generation did not finish within " + std::to_string(timeout.count()) + " ms";
    return outcome;
  }
  return future.get();
}

size_t BoundedGenerator::in_flight() const {
  std::lock_guard<std::mutex> lock(workers_->mutex);
  return workers_->in_flight;
}

bool BoundedGenerator::wait_until_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(workers_->mutex);
  return workers_->idle.wait_for(lock, timeout, [this] { return workers_->in_flight == 0; });
}

}  // namespace voxrag_core
