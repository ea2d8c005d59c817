#include "frame_source.hpp"
#include "pattern_source.hpp"
#include "realsense_source.hpp"

#include <iostream>

namespace framecast {

const char* to_string(GrabStatus status) {
    switch (status) {
        case GrabStatus::Ok: return "ok";
        case GrabStatus::Miss: return "miss";
        case GrabStatus::Fatal: return "fatal";
    }
    return "unknown";
}

bool FrameSource::open(const StreamEndpointConfig& config) {
    if (open_) {
        return true;
    }
    open_ = do_open(config);
    return open_;
}

GrabStatus FrameSource::grab(Frame& out, int timeout_ms) {
    if (!open_) {
        return GrabStatus::Fatal;
    }
    return do_grab(out, timeout_ms);
}

void FrameSource::close() {
    if (!open_) {
        return;
    }
    open_ = false;
    do_release();
    std::cout << "[source:" << name() << "] Device closed" << std::endl;
}

bool parse_source_kind(const std::string& text, SourceKind& out) {
    if (text == "realsense") {
        out = SourceKind::RealSense;
    } else if (text == "pattern") {
        out = SourceKind::Pattern;
    } else {
        return false;
    }
    return true;
}

const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::RealSense: return "realsense";
        case SourceKind::Pattern: return "pattern";
    }
    return "unknown";
}

std::unique_ptr<FrameSource> make_frame_source(SourceKind kind) {
    switch (kind) {
        case SourceKind::RealSense: return std::make_unique<RealSenseSource>();
        case SourceKind::Pattern: return std::make_unique<PatternSource>();
    }
    return nullptr;
}

} // namespace framecast
