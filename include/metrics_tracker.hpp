#pragma once

#include "frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace framecast {

// Rolling FPS over the last N inter-arrival intervals, plus latency.
//
// Latency assumes the producer and consumer clocks are in sync. Skew between
// hosts shows up directly in the number and is not corrected here.
class MetricsTracker {
public:
    static constexpr size_t kDefaultWindow = 30;

    explicit MetricsTracker(size_t window = kDefaultWindow);

    void record_arrival(Timestamp now);

    // 0 until at least two arrivals have been recorded.
    double current_fps() const;

    static std::chrono::microseconds latency(Timestamp captured_at, Timestamp now);

    uint64_t arrival_count() const { return arrivals_; }
    size_t sample_count() const { return count_; }
    size_t window() const { return samples_.size(); }

    void reset();

private:
    std::vector<int64_t> samples_;  // inter-arrival durations, microseconds
    size_t head_ = 0;
    size_t count_ = 0;
    int64_t sum_us_ = 0;

    Timestamp last_arrival_;
    uint64_t arrivals_ = 0;
};

} // namespace framecast
