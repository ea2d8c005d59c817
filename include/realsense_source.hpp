#pragma once

#include "frame_source.hpp"

#include <librealsense2/rs.hpp>
#include <memory>

namespace framecast {

// Color (RGB8) plus optional Z16 depth aligned to the color viewport.
class RealSenseSource : public FrameSource {
public:
    RealSenseSource();
    ~RealSenseSource() override;

    const char* name() const override { return "realsense"; }

    // RealSense color modes nearest to each class; 2k has none.
    static bool native_resolution(ResolutionClass res, Resolution& out);

protected:
    bool do_open(const StreamEndpointConfig& config) override;
    GrabStatus do_grab(Frame& out, int timeout_ms) override;
    void do_release() override;

private:
    std::unique_ptr<rs2::pipeline> pipeline_;
    std::unique_ptr<rs2::align> align_;
    bool enable_depth_ = false;
    float depth_scale_ = 0.001f;
};

} // namespace framecast
