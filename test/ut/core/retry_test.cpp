#include <boost/ut.hpp>
#include <corral/retry.h>

using namespace boost::ut;
using namespace corral;
using namespace std::chrono_literals;

namespace {

const RetryConfig FAST{3, 1ms, 4ms, 2.0};

} // namespace

suite retry_tests = [] {
    "profiles match the documented constants"_test = [] {
        expect(retry::NAVIGATION.maxAttempts == 2_i);
        expect(retry::NAVIGATION.initialDelay == 2000ms);
        expect(retry::NAVIGATION.maxDelay == 10000ms);
        expect(retry::NAVIGATION.backoffMultiplier == 2.0);

        expect(retry::ACTION.maxAttempts == 3_i);
        expect(retry::ACTION.initialDelay == 500ms);
        expect(retry::ACTION.maxDelay == 5000ms);
        expect(retry::ACTION.backoffMultiplier == 1.5);
    };

    "backoff grows geometrically and is capped"_test = [] {
        expect(backoffDelay(retry::ACTION, 1) == 500ms);
        expect(backoffDelay(retry::ACTION, 2) == 750ms);
        expect(backoffDelay(retry::ACTION, 3) == 1125ms);

        expect(backoffDelay(retry::NAVIGATION, 1) == 2000ms);
        expect(backoffDelay(retry::NAVIGATION, 2) == 4000ms);
        expect(backoffDelay(retry::NAVIGATION, 3) == 8000ms);
        expect(backoffDelay(retry::NAVIGATION, 4) == 10000ms);
        expect(backoffDelay(retry::NAVIGATION, 10) == 10000ms);
    };

    "first success returns without retrying"_test = [] {
        int calls = 0;
        auto result = retryWithBackoff([&]() -> Result<int> {
            ++calls;
            return Ok(42);
        }, FAST, "ok");
        expect(result.has_value());
        expect(*result == 42_i);
        expect(calls == 1_i);
    };

    "retryable failure is attempted maxAttempts times"_test = [] {
        int calls = 0;
        auto result = retryWithBackoff([&]() -> Result<void> {
            ++calls;
            return Err(Error::actionError("click", "attempt " + std::to_string(calls)));
        }, FAST, "click");
        expect(!result);
        expect(calls == 3_i);
        expect(result.error().code() == ErrorCode::ActionError);
        expect(result.error().message().find("attempt 3") != std::string::npos);
    };

    "success after transient failures"_test = [] {
        int calls = 0;
        auto result = retryWithBackoff([&]() -> Result<std::string> {
            if (++calls < 3) {
                return Err<std::string>(Error::navigationError("https://a.test", "timeout"));
            }
            return Ok(std::string("done"));
        }, FAST, "navigate");
        expect(result.has_value());
        expect(*result == std::string("done"));
        expect(calls == 3_i);
    };

    "security errors are never retried"_test = [] {
        int calls = 0;
        auto result = retryWithBackoff([&]() -> Result<void> {
            ++calls;
            return Err(Error::securityError("blocked"));
        }, FAST, "navigate");
        expect(!result);
        expect(calls == 1_i);
    };

    "service unavailable is never retried"_test = [] {
        int calls = 0;
        auto result = retryWithBackoff([&]() -> Result<void> {
            ++calls;
            return Err(Error::serviceNotAvailable("down"));
        }, FAST, "navigate");
        expect(calls == 1_i);
        expect(result.error().code() == ErrorCode::ServiceNotAvailable);
    };

    "non-positive maxAttempts still runs once"_test = [] {
        int calls = 0;
        RetryConfig none{0, 1ms, 1ms, 1.0};
        auto result = retryWithBackoff([&]() -> Result<void> {
            ++calls;
            return Err(Error::actionError("click", "nope"));
        }, none, "click");
        expect(!result);
        expect(calls == 1_i);
    };
};
