#include "rate_controller.hpp"

#include <algorithm>
#include <iomanip>

namespace prefixcrawl {

RateController::RateController(double initial_delay, double min_delay, double max_delay, Log& log)
    : min_delay_(min_delay),
      max_delay_(std::max(min_delay, max_delay)),
      log_(log),
      delay_(std::min(std::max(initial_delay, min_delay_), max_delay_)) {}

void RateController::report_success() {
    double changed_to = -1.0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        rolling_success_++;
        total_success_++;

        const double ratio = static_cast<double>(rolling_success_) /
                             static_cast<double>(std::max<uint64_t>(1, rolling_success_ + rolling_failure_));
        if (ratio > kDecayRatio && rolling_success_ > kMinSamples) {
            delay_ = std::max(min_delay_, delay_ * kDecayFactor);
            rolling_success_ = kRetainedSuccesses;
            rolling_failure_ = kRetainedFailures;
            changed_to = delay_;
        }
    }
    if (changed_to >= 0.0) {
        log_.info(msg() << "Decreased delay to " << std::fixed << std::setprecision(2) << changed_to
                        << "s after consistent success");
    }
}

void RateController::report_failure() {
    double changed_to = 0.0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        delay_ = std::min(max_delay_, std::max(delay_, kGrowFloor) * kGrowFactor);
        rolling_success_ = 0;
        rolling_failure_++;
        total_failure_++;
        changed_to = delay_;
    }
    log_.info(msg() << "Increased delay to " << std::fixed << std::setprecision(2) << changed_to
                    << "s after failure");
}

double RateController::delay() const {
    std::lock_guard<std::mutex> lock(mu_);
    return delay_;
}

double RateController::delay_for(size_t prefix_length) const {
    const double d = delay();
    if (prefix_length > kShortPrefix) return std::max(min_delay_, d * kDeepPrefixFactor);
    return d;
}

RateController::Snapshot RateController::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    Snapshot s;
    s.delay = delay_;
    s.rolling_success = rolling_success_;
    s.rolling_failure = rolling_failure_;
    s.total_success = total_success_;
    s.total_failure = total_failure_;
    return s;
}

}  // namespace prefixcrawl
