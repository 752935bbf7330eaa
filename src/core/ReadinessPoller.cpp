#include "core/ReadinessPoller.hpp"
#include <algorithm>
#include <thread>

namespace core {

    Sleeper make_interruptible_sleeper(common::CancellationToken token) {
        return [token](std::chrono::milliseconds duration) {
            const auto slice = std::chrono::milliseconds(50);
            auto remaining = duration;
            while (remaining.count() > 0 && !token.is_cancellation_requested()) {
                auto step = std::min(remaining, slice);
                std::this_thread::sleep_for(step);
                remaining -= step;
            }
        };
    }

} // namespace core
