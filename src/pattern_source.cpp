#include "pattern_source.hpp"

#include <iostream>
#include <thread>

namespace framecast {

PatternSource::PatternSource() = default;

PatternSource::~PatternSource() {
    close();
}

bool PatternSource::do_open(const StreamEndpointConfig& config) {
    if (config.fps <= 0) {
        std::cerr << "[source:pattern] Invalid fps: " << config.fps << std::endl;
        return false;
    }

    size_ = resolution_size(config.resolution);
    enable_depth_ = config.enable_depth;
    interval_ = std::chrono::microseconds(1000000 / config.fps);
    next_frame_ = std::chrono::steady_clock::now();
    frame_count_ = 0;

    std::cout << "[source:pattern] Test pattern " << size_.width << "x" << size_.height
              << " @ " << config.fps << "fps, depth "
              << (enable_depth_ ? "enabled" : "disabled") << std::endl;
    return true;
}

GrabStatus PatternSource::do_grab(Frame& out, int timeout_ms) {
    using namespace std::chrono;

    const auto now = steady_clock::now();
    if (next_frame_ > now) {
        if (next_frame_ - now > milliseconds(timeout_ms)) {
            std::this_thread::sleep_for(milliseconds(timeout_ms));
            return GrabStatus::Miss;
        }
        std::this_thread::sleep_until(next_frame_);
    } else if (now - next_frame_ > interval_ * 2) {
        // Fell behind; don't burst to catch up
        next_frame_ = now;
    }
    next_frame_ += interval_;

    out.captured_at = now_timestamp();

    ImageBuffer& image = out.image;
    image.width = size_.width;
    image.height = size_.height;
    image.channels = 3;
    image.data.resize(image.expected_size());

    const int shift = static_cast<int>(frame_count_ * 4);
    uint8_t* px = image.data.data();
    for (int y = 0; y < image.height; ++y) {
        for (int x = 0; x < image.width; ++x) {
            *px++ = static_cast<uint8_t>((x + shift) & 0xFF);
            *px++ = static_cast<uint8_t>(y & 0xFF);
            *px++ = static_cast<uint8_t>(((x + y) / 2 + shift) & 0xFF);
        }
    }

    out.depth = DepthBuffer();
    if (enable_depth_) {
        DepthBuffer& depth = out.depth;
        depth.width = size_.width;
        depth.height = size_.height;
        depth.scale = 0.001f;
        depth.data.resize(depth.expected_size());
        // Ramp from 0.5m at the top to ~5m at the bottom
        for (int y = 0; y < depth.height; ++y) {
            const uint16_t mm = static_cast<uint16_t>(500 + (4500 * y) / depth.height);
            for (int x = 0; x < depth.width; ++x) {
                depth.data[y * depth.width + x] = mm;
            }
        }
    }

    frame_count_++;
    return GrabStatus::Ok;
}

void PatternSource::do_release() {
    std::cout << "[source:pattern] Generated " << frame_count_ << " frames" << std::endl;
}

} // namespace framecast
