#pragma once

#include <chrono>

namespace taskproc {

/**
 * RetryPolicy - bounded exponential backoff for failed handlers
 *
 * The n-th retry (n starting at 0) waits min(unit * multiplier^n, max_units * unit).
 * No jitter: the same failure sequence always produces the same delays.
 * Shared by every handler registered on an adapter.
 */
class RetryPolicy {
public:
    static constexpr int DEFAULT_MAX_BACKOFF_UNITS = 60;

    RetryPolicy(int max_retries,
                std::chrono::milliseconds unit = std::chrono::milliseconds(1000),
                double multiplier = 2.0,
                int max_backoff_units = DEFAULT_MAX_BACKOFF_UNITS);

    // retries_done is the number of retries already performed for the task
    bool should_retry(int retries_done) const;

    std::chrono::milliseconds delay_for(int retries_done) const;

    int max_retries() const { return max_retries_; }
    std::chrono::milliseconds unit() const { return unit_; }
    std::chrono::milliseconds max_delay() const { return unit_ * max_backoff_units_; }

private:
    int max_retries_;
    std::chrono::milliseconds unit_;
    double multiplier_;
    int max_backoff_units_;
};

} // namespace taskproc
