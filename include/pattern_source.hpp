#pragma once

#include "frame_source.hpp"

#include <chrono>
#include <cstdint>

namespace framecast {

// Synthetic moving test pattern for runs without hardware. Paced to the
// configured frame rate, so grab() blocks up to one frame interval.
class PatternSource : public FrameSource {
public:
    PatternSource();
    ~PatternSource() override;

    const char* name() const override { return "pattern"; }

    uint64_t get_frame_count() const { return frame_count_; }

protected:
    bool do_open(const StreamEndpointConfig& config) override;
    GrabStatus do_grab(Frame& out, int timeout_ms) override;
    void do_release() override;

private:
    Resolution size_{0, 0};
    bool enable_depth_ = false;
    std::chrono::microseconds interval_{0};
    std::chrono::steady_clock::time_point next_frame_;
    uint64_t frame_count_ = 0;
};

} // namespace framecast
