#include "metrics_tracker.hpp"

#include <algorithm>

namespace framecast {

MetricsTracker::MetricsTracker(size_t window)
    : samples_(window == 0 ? 1 : window, 0)
{
}

void MetricsTracker::record_arrival(Timestamp now) {
    if (arrivals_++ == 0) {
        last_arrival_ = now;
        return;
    }

    const int64_t delta = (now - last_arrival_).count();
    last_arrival_ = now;

    // Ring: overwrite the oldest once full
    if (count_ == samples_.size()) {
        sum_us_ -= samples_[head_];
    } else {
        count_++;
    }
    samples_[head_] = delta;
    sum_us_ += delta;
    head_ = (head_ + 1) % samples_.size();
}

double MetricsTracker::current_fps() const {
    if (arrivals_ < 2 || count_ == 0 || sum_us_ <= 0) {
        return 0.0;
    }
    const double mean_s = static_cast<double>(sum_us_) / count_ / 1e6;
    return 1.0 / mean_s;
}

std::chrono::microseconds MetricsTracker::latency(Timestamp captured_at, Timestamp now) {
    return now - captured_at;
}

void MetricsTracker::reset() {
    std::fill(samples_.begin(), samples_.end(), 0);
    head_ = 0;
    count_ = 0;
    sum_us_ = 0;
    arrivals_ = 0;
    last_arrival_ = Timestamp();
}

} // namespace framecast
