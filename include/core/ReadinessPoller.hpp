#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"

namespace core {

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct PollPolicy {
        int max_attempts;
        std::chrono::milliseconds interval;
    };

    // Sleeps in short slices and returns early once the token is cancelled.
    Sleeper make_interruptible_sleeper(common::CancellationToken token);

    // ============================================================================
    // poll_until - bounded readiness polling
    // ============================================================================
    // Evaluates probe() up to policy.max_attempts times, sleeping
    // policy.interval between attempts (never after the last one).
    //   - probe returns std::optional<T>; the first engaged value wins.
    //   - A probe that succeeds on attempt k costs exactly k evaluations
    //     and k-1 sleeps.
    //   - Exhaustion yields ErrorCode::Timeout; an interrupt seen on the
    //     token yields ErrorCode::Cancelled.
    // Runs on the calling thread; callers translate Timeout into their own
    // error code (StartupTimeout, NodeNotFound).
    // ============================================================================
    template <typename Probe>
    auto poll_until(Probe&& probe,
                    const PollPolicy& policy,
                    const Sleeper& sleeper,
                    const common::CancellationToken& token,
                    const std::string& what)
        -> common::Result<typename std::invoke_result_t<Probe&>::value_type>
    {
        using Value = typename std::invoke_result_t<Probe&>::value_type;

        for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
            if (token.is_cancellation_requested()) {
                return common::Result<Value>::err(
                    common::ErrorCode::Cancelled, "Interrupted while waiting for " + what);
            }

            auto value = probe();
            if (value) {
                return common::Result<Value>::ok(std::move(*value));
            }

            if (attempt < policy.max_attempts) {
                sleeper(policy.interval);
            }
        }

        return common::Result<Value>::err(
            common::ErrorCode::Timeout,
            what + " not ready after " + std::to_string(policy.max_attempts) + " attempts");
    }

    // Boolean-predicate variant
    template <typename Predicate>
    common::EmptyResult poll_until_true(Predicate&& predicate,
                                        const PollPolicy& policy,
                                        const Sleeper& sleeper,
                                        const common::CancellationToken& token,
                                        const std::string& what)
    {
        auto result = poll_until(
            [&]() -> std::optional<common::Ok> {
                if (predicate()) return common::Ok{};
                return std::nullopt;
            },
            policy, sleeper, token, what);

        if (result.is_err()) return result.error();
        return common::EmptyResult::success();
    }

    // Rewrites a generic Timeout into a caller-specific code, leaving
    // Cancelled and other errors untouched.
    inline common::AppError retag_timeout(const common::AppError& error,
                                          common::ErrorCode code,
                                          const std::string& message) {
        if (error.code != common::ErrorCode::Timeout) return error;
        return common::AppError{code, message, error.location};
    }

} // namespace core
