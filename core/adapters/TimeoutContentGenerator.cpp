#include "TimeoutContentGenerator.hpp"
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace senate::adapters {

TimeoutContentGenerator::TimeoutContentGenerator(std::shared_ptr<ports::IContentGenerator> inner,
                                                 std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout), busy_(std::make_shared<std::atomic<bool>>(false)) {
    if (!inner_) {
        throw std::invalid_argument("TimeoutContentGenerator requires an inner generator");
    }
}

ports::GenerationResult TimeoutContentGenerator::generate(const ports::SpeechRequest& request) {
    bool idle = false;
    if (!busy_->compare_exchange_strong(idle, true)) {
        return ports::GenerationResult::failure(
            ports::GenerationStatus::Failed,
            "generator still busy with a timed-out request");
    }

    auto promise = std::make_shared<std::promise<ports::GenerationResult>>();
    auto future = promise->get_future();

    try {
        std::thread worker([inner = inner_, busy = busy_, request, promise]() {
            ports::GenerationResult result;
            try {
                result = inner->generate(request);
            } catch (const std::exception& e) {
                result = ports::GenerationResult::failure(ports::GenerationStatus::Failed, e.what());
            } catch (...) {
                result = ports::GenerationResult::failure(ports::GenerationStatus::Failed,
                                                          "non-standard exception");
            }
            // Cleared before the result is delivered.
            busy->store(false);
            promise->set_value(std::move(result));
        });
        worker.detach();
    } catch (const std::system_error& e) {
        busy_->store(false);
        return ports::GenerationResult::failure(ports::GenerationStatus::Failed, e.what());
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        return ports::GenerationResult::failure(
            ports::GenerationStatus::TimedOut,
            "generation exceeded " + std::to_string(timeout_.count()) + " ms");
    }
    return future.get();
}

} // namespace senate::adapters
