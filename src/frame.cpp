#include "frame.hpp"

#include <cmath>

namespace framecast {

double to_epoch_seconds(Timestamp ts) {
    return static_cast<double>(ts.time_since_epoch().count()) / 1e6;
}

Timestamp from_epoch_seconds(double seconds) {
    // Microsecond counts stay exact through a double until ~2^53
    return Timestamp(std::chrono::microseconds(std::llround(seconds * 1e6)));
}

} // namespace framecast
