#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>

#include "log.hpp"

namespace prefixcrawl {

// Process-wide delay between requests, tuned from observed outcomes.
// Failures grow the delay by 1.5x; a long enough run of successes (above 85%
// over more than 30 samples) shrinks it by 3%. The value never leaves
// [min_delay, max_delay].
class RateController {
public:
    static constexpr double kGrowFactor = 1.5;
    // A failure grows the delay from at least this value, so a zero delay can still back off.
    static constexpr double kGrowFloor = 0.1;
    static constexpr double kDecayFactor = 0.97;
    static constexpr double kDecayRatio = 0.85;
    static constexpr uint64_t kMinSamples = 30;
    static constexpr uint64_t kRetainedSuccesses = 15;
    static constexpr uint64_t kRetainedFailures = 2;

    // Delay multiplier for prefixes longer than kShortPrefix.
    static constexpr double kDeepPrefixFactor = 0.8;
    static constexpr size_t kShortPrefix = 3;

    struct Snapshot {
        double delay = 0.0;
        uint64_t rolling_success = 0;
        uint64_t rolling_failure = 0;
        uint64_t total_success = 0;
        uint64_t total_failure = 0;
    };

    RateController(double initial_delay, double min_delay, double max_delay, Log& log);

    void report_success();
    void report_failure();

    double delay() const;

    // Delay a worker should wait after finishing `prefix_length`.
    double delay_for(size_t prefix_length) const;

    double min_delay() const { return min_delay_; }
    double max_delay() const { return max_delay_; }

    Snapshot snapshot() const;

private:
    const double min_delay_;
    const double max_delay_;
    Log& log_;

    mutable std::mutex mu_;
    double delay_;
    uint64_t rolling_success_ = 0;
    uint64_t rolling_failure_ = 0;
    uint64_t total_success_ = 0;
    uint64_t total_failure_ = 0;
};

}  // namespace prefixcrawl
