#include "taskproc/retry_policy.hpp"
#include <algorithm>
#include <cmath>

namespace taskproc {

RetryPolicy::RetryPolicy(int max_retries,
                         std::chrono::milliseconds unit,
                         double multiplier,
                         int max_backoff_units)
    : max_retries_(std::max(0, max_retries)),
      unit_(unit),
      multiplier_(multiplier),
      max_backoff_units_(max_backoff_units) {
}

bool RetryPolicy::should_retry(int retries_done) const {
    return retries_done < max_retries_;
}

std::chrono::milliseconds RetryPolicy::delay_for(int retries_done) const {
    double units = std::pow(multiplier_, std::max(0, retries_done));
    units = std::min(units, static_cast<double>(max_backoff_units_));
    return std::chrono::milliseconds(static_cast<int64_t>(units * static_cast<double>(unit_.count())));
}

} // namespace taskproc
