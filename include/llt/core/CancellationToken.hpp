/**
 * CancellationToken.hpp - Shared "keep running" signal for pipeline stages
 *
 * Copies share the same state. Every blocking wait in the pipeline uses a
 * timeout and re-checks the token afterwards.
 */

#pragma once

#include <atomic>
#include <memory>

namespace llt::core {

class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { state_->store(true); }
    bool isCancelled() const { return state_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace llt::core
