#pragma once

#include <corral/result.hpp>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <type_traits>

namespace corral {

struct RetryConfig {
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{500};
    std::chrono::milliseconds maxDelay{5000};
    double backoffMultiplier = 1.5;
};

namespace retry {

// Navigation: fewer attempts, longer waits
inline constexpr RetryConfig NAVIGATION{2, std::chrono::milliseconds(2000),
                                        std::chrono::milliseconds(10000), 2.0};

// DOM interaction: more attempts, shorter waits
inline constexpr RetryConfig ACTION{3, std::chrono::milliseconds(500),
                                    std::chrono::milliseconds(5000), 1.5};

} // namespace retry

// Delay slept after the given number of failed attempts (1-based)
inline std::chrono::milliseconds backoffDelay(const RetryConfig& config, int failedAttempts) {
    double delay = static_cast<double>(config.initialDelay.count());
    const double cap = static_cast<double>(config.maxDelay.count());
    for (int i = 1; i < failedAttempts && delay < cap; ++i) {
        delay *= config.backoffMultiplier;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

// Run op until it succeeds, a non-retryable error comes back, or
// maxAttempts is used up. The last error is returned unchanged.
template<typename Op>
auto retryWithBackoff(Op&& op, const RetryConfig& config, const std::string& label)
    -> std::invoke_result_t<Op&> {
    const int attempts = std::max(1, config.maxAttempts);
    for (int attempt = 1;; ++attempt) {
        auto result = op();
        if (result) {
            if (attempt > 1) {
                ydebug("{}: succeeded on attempt {}", label, attempt);
            }
            return result;
        }
        const auto& error = result.error();
        if (!error.retryable()) {
            ydebug("{}: {} is not retryable: {}", label, errorCodeName(error.code()), error.message());
            return result;
        }
        if (attempt >= attempts) {
            ywarn("{}: giving up after {} attempts: {}", label, attempt, error.message());
            return result;
        }
        auto delay = backoffDelay(config, attempt);
        ywarn("{}: attempt {}/{} failed, retrying in {}ms: {}",
              label, attempt, attempts, delay.count(), error.message());
        std::this_thread::sleep_for(delay);
    }
}

} // namespace corral
