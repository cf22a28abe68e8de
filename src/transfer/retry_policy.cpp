#include "partvault/transfer/retry_policy.hpp"
#include "partvault/core/logger.hpp"
#include "partvault/crypto/random.hpp"
#include <algorithm>
#include <cmath>
#include <thread>

namespace partvault::transfer {

Sleeper real_sleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

std::chrono::milliseconds RetryPolicy::delay_after_failure(std::uint32_t step) const {
    double factor = std::pow(backoff_multiplier, static_cast<double>(step));
    double delay_ms = static_cast<double>(base_delay.count()) * factor;

    // Also catches inf and NaN from a large step
    if (!(delay_ms < static_cast<double>(max_delay.count()))) {
        return max_delay;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, delay_ms)));
}

std::chrono::milliseconds RetryPolicy::draw_jitter() const {
    if (jitter_max <= jitter_min) {
        return jitter_min;
    }

    auto span = static_cast<std::uint32_t>((jitter_max - jitter_min).count()) + 1;
    return jitter_min + std::chrono::milliseconds(crypto::SecureRandom::generate_uniform(span));
}

RetryPolicy RetryPolicy::fixed_delay(std::uint32_t attempts, std::chrono::milliseconds delay) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.base_delay = delay;
    policy.backoff_multiplier = 1.0;
    return policy;
}

RetryPolicy RetryPolicy::exponential(std::uint32_t attempts,
                                     std::chrono::milliseconds base,
                                     double multiplier,
                                     std::chrono::milliseconds jitter_max) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.base_delay = base;
    policy.backoff_multiplier = multiplier;
    policy.jitter_max = jitter_max;
    return policy;
}

RetryExecutor::RetryExecutor(RetryPolicy policy, Sleeper sleeper, const CancellationToken* cancel)
    : policy_(policy)
    , sleeper_(std::move(sleeper))
    , cancel_(cancel) {
    if (policy_.max_attempts == 0) {
        policy_.max_attempts = 1;
    }
}

RetryOutcome RetryExecutor::run(const Operation& operation, const std::string& description) const {
    RetryOutcome outcome;

    auto jitter = policy_.draw_jitter();
    if (jitter.count() > 0) {
        sleeper_(jitter);
    }

    std::uint32_t backoff_step = 0;

    while (outcome.attempts < policy_.max_attempts) {
        if (cancelled()) {
            outcome.cancelled = true;
            return outcome;
        }

        outcome.attempts++;
        outcome.result = operation();

        if (outcome.result.success()) {
            return outcome;
        }

        if (!outcome.result.retryable()) {
            LOG_ERROR("{} failed permanently: {}", description, outcome.result.message);
            return outcome;
        }

        if (outcome.attempts >= policy_.max_attempts) {
            break;
        }

        std::chrono::milliseconds wait;
        if (outcome.result.kind == transport::TransportErrorKind::RATE_LIMITED) {
            wait = std::chrono::duration_cast<std::chrono::milliseconds>(outcome.result.retry_after);
            LOG_WARN("{} rate limited, waiting {}s (attempt {}/{})",
                     description, outcome.result.retry_after.count(),
                     outcome.attempts, policy_.max_attempts);
        } else {
            wait = policy_.delay_after_failure(backoff_step++);
            LOG_WARN("{} failed: {}; retrying in {}ms (attempt {}/{})",
                     description, outcome.result.message, wait.count(),
                     outcome.attempts, policy_.max_attempts);
        }

        sleeper_(wait);
    }

    LOG_ERROR("{} gave up after {} attempts: {}", description, outcome.attempts, outcome.result.message);
    return outcome;
}

} // namespace partvault::transfer
