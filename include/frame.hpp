#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace framecast {

// Wall clock so producer and consumer timestamps can be compared.
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

inline Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

double to_epoch_seconds(Timestamp ts);
Timestamp from_epoch_seconds(double seconds);

struct ImageBuffer {
    std::vector<uint8_t> data;  // tightly packed, RGB or gray
    int width = 0;
    int height = 0;
    int channels = 0;

    size_t expected_size() const {
        return static_cast<size_t>(width) * height * channels;
    }
    bool empty() const { return data.empty(); }
};

struct DepthBuffer {
    std::vector<uint16_t> data;
    int width = 0;
    int height = 0;
    float scale = 0.001f;  // meters per unit

    size_t expected_size() const {
        return static_cast<size_t>(width) * height;
    }
    bool empty() const { return data.empty(); }
};

struct Frame {
    Timestamp captured_at;
    ImageBuffer image;
    DepthBuffer depth;  // empty unless depth mode is on

    bool has_depth() const { return !depth.empty(); }
};

} // namespace framecast
