#pragma once

#include <atomic>
#include <memory>

namespace querywatch {

/**
 * @brief Cooperative cancellation flag shared between an owner and its workers
 *
 * Copies observe the same flag. Cancellation is one-way; a cancelled token
 * stays cancelled. A default-constructed token is never cancelled unless
 * cancel() is called on it (or a copy).
 */
class CancellationToken {
public:
    CancellationToken()
        : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_->load(std::memory_order_acquire);
    }

    void cancel() noexcept {
        cancelled_->store(true, std::memory_order_release);
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace querywatch
