// =============================================================================
// genoqc - Batch Cancellation
// =============================================================================
// Cancellation signal shared by every component of one batch.
//
// requestCancel() only touches an atomic flag, so it may be called from a
// signal handler. Waiters poll the flag in short slices instead of blocking on
// a condition variable for the same reason.
// =============================================================================

#ifndef GQC_COMMON_CANCELLATION_H
#define GQC_COMMON_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <memory>

namespace gqc {

/// @brief Polling granularity of CancellationToken::waitFor().
inline constexpr std::chrono::milliseconds kCancellationPollInterval{50};

/// @brief Batch-level cancellation flag.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// @brief Request cancellation. Async-signal-safe.
    void requestCancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// @brief Clear a previous request (only between batches).
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }

    /// @brief Sleep for up to @p duration, waking early on cancellation.
    /// @return true if cancellation was requested before or during the wait.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds duration) const;

private:
    static_assert(std::atomic<bool>::is_always_lock_free);

    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

/// @brief Create a fresh, uncancelled token.
[[nodiscard]] inline CancellationTokenPtr makeCancellationToken() {
    return std::make_shared<CancellationToken>();
}

}  // namespace gqc

#endif  // GQC_COMMON_CANCELLATION_H
