// =============================================================================
// genoqc - Batch Cancellation Implementation
// =============================================================================

#include "gqc/common/cancellation.h"

#include <algorithm>
#include <thread>

namespace gqc {

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!isCancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kCancellationPollInterval));
    }
    return true;
}

}  // namespace gqc
