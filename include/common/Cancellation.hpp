#pragma once
#include <atomic>
#include <memory>

namespace common {

    // The Token (View) - passed to blocking steps (poller, portal loop, pipeline wait)
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
            std::atomic<int> signal_number{0};
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        // Signal that caused the request, 0 if cancelled programmatically
        int signal_number() const {
            return state ? state->signal_number.load(std::memory_order_acquire) : 0;
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - held by main and by the signal handler.
    // cancel() only touches lock-free atomics, so it may be called from a
    // signal handler.
    class CancellationSource {
        CancellationToken token;

    public:
        CancellationSource() = default;

        // Set with RELEASE memory order (flushes prior writes)
        void cancel(int signal_number = 0) {
            if (token.state) {
                token.state->signal_number.store(signal_number, std::memory_order_release);
                token.state->requested.store(true, std::memory_order_release);
            }
        }

        CancellationToken get_token() const { return token; }
    };

} // namespace common
