#pragma once

#include "transfer_types.hpp"
#include "../transport/part_transport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace partvault::transfer {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Blocks the calling thread
Sleeper real_sleeper();

struct RetryPolicy {
    std::uint32_t max_attempts = 10;
    std::chrono::milliseconds base_delay{5000};
    double backoff_multiplier = 1.0;

    // Upper bound on any computed backoff delay
    std::chrono::milliseconds max_delay{std::chrono::minutes(10)};

    // Random delay before the first attempt, drawn from [jitter_min, jitter_max]
    std::chrono::milliseconds jitter_min{0};
    std::chrono::milliseconds jitter_max{0};

    // Delay after the failure at backoff step `step` (0-based)
    std::chrono::milliseconds delay_after_failure(std::uint32_t step) const;

    std::chrono::milliseconds draw_jitter() const;

    static RetryPolicy fixed_delay(std::uint32_t attempts, std::chrono::milliseconds delay);
    static RetryPolicy exponential(std::uint32_t attempts,
                                   std::chrono::milliseconds base,
                                   double multiplier,
                                   std::chrono::milliseconds jitter_max = std::chrono::milliseconds(0));
};

struct RetryOutcome {
    transport::TransportResult result;
    std::uint32_t attempts = 0;
    bool cancelled = false;
};

// Runs a transport operation until it succeeds, fails permanently, exhausts
// max_attempts or the token is cancelled. A rate-limited attempt waits the
// server-given delay and leaves the backoff step where it was; it still
// counts against max_attempts.
class RetryExecutor {
public:
    using Operation = std::function<transport::TransportResult()>;

    RetryExecutor(RetryPolicy policy, Sleeper sleeper, const CancellationToken* cancel = nullptr);

    RetryOutcome run(const Operation& operation, const std::string& description) const;

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    const CancellationToken* cancel_;

    bool cancelled() const { return cancel_ && cancel_->is_cancelled(); }
};

} // namespace partvault::transfer
