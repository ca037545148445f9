#pragma once

#include "../ports/IContentGenerator.hpp"
#include <atomic>
#include <chrono>
#include <memory>

namespace senate::adapters {

// Bounds an external generator call. The inner call runs on a detached worker;
// on timeout its eventual result is dropped. At most one inner call is active:
// while a timed-out worker is still running, new requests fail immediately.
class TimeoutContentGenerator : public ports::IContentGenerator {
public:
    TimeoutContentGenerator(std::shared_ptr<ports::IContentGenerator> inner,
                            std::chrono::milliseconds timeout);

    ports::GenerationResult generate(const ports::SpeechRequest& request) override;

    std::chrono::milliseconds timeout() const { return timeout_; }
    bool busy() const { return busy_->load(); }

private:
    std::shared_ptr<ports::IContentGenerator> inner_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<std::atomic<bool>> busy_;
};

} // namespace senate::adapters
