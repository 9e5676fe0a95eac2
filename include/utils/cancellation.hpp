#pragma once

#include <atomic>
#include <memory>

namespace printvoice {
namespace utils {

/**
 * Shared cancellation flag handed to every stage of a turn. Copies observe
 * the same flag; cancel() is sticky.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool isCancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace utils
} // namespace printvoice
