#include "realsense_source.hpp"

#include <cstring>
#include <iostream>

namespace framecast {

RealSenseSource::RealSenseSource() = default;

RealSenseSource::~RealSenseSource() {
    close();
}

bool RealSenseSource::native_resolution(ResolutionClass res, Resolution& out) {
    switch (res) {
        case ResolutionClass::VGA: out = {640, 480}; return true;
        case ResolutionClass::HD720: out = {1280, 720}; return true;
        case ResolutionClass::HD1080: out = {1920, 1080}; return true;
        case ResolutionClass::HD2K: return false;
    }
    return false;
}

bool RealSenseSource::do_open(const StreamEndpointConfig& config) {
    Resolution size{0, 0};
    if (!native_resolution(config.resolution, size)) {
        std::cerr << "[source:realsense] Resolution " << to_string(config.resolution)
                  << " not supported by this device" << std::endl;
        return false;
    }

    try {
        pipeline_ = std::make_unique<rs2::pipeline>();

        rs2::config cfg;
        cfg.enable_stream(RS2_STREAM_COLOR, size.width, size.height,
                          RS2_FORMAT_RGB8, config.fps);
        if (config.enable_depth) {
            cfg.enable_stream(RS2_STREAM_DEPTH, size.width, size.height,
                              RS2_FORMAT_Z16, config.fps);
        }

        if (!config.device_serial.empty()) {
            cfg.enable_device(config.device_serial);
        }

        rs2::pipeline_profile profile = pipeline_->start(cfg);
        enable_depth_ = config.enable_depth;

        if (enable_depth_) {
            align_ = std::make_unique<rs2::align>(RS2_STREAM_COLOR);
            depth_scale_ = profile.get_device().first<rs2::depth_sensor>().get_depth_scale();
        }

        rs2::device dev = profile.get_device();
        std::cout << "[source:realsense] Camera initialized:\n"
                  << "  Model: " << dev.get_info(RS2_CAMERA_INFO_NAME) << "\n"
                  << "  Serial: " << dev.get_info(RS2_CAMERA_INFO_SERIAL_NUMBER) << "\n"
                  << "  Resolution: " << size.width << "x" << size.height
                  << " @ " << config.fps << "fps\n"
                  << "  Depth: " << (enable_depth_ ? "Enabled" : "Disabled") << std::endl;
        return true;

    } catch (const rs2::error& e) {
        std::cerr << "[source:realsense] RealSense error: " << e.what() << std::endl;
        pipeline_.reset();
        align_.reset();
        return false;
    }
}

GrabStatus RealSenseSource::do_grab(Frame& out, int timeout_ms) {
    try {
        rs2::frameset frames;
        if (!pipeline_->try_wait_for_frames(&frames, static_cast<unsigned int>(timeout_ms))) {
            return GrabStatus::Miss;
        }
        out.captured_at = now_timestamp();

        if (align_) {
            frames = align_->process(frames);
        }

        rs2::video_frame color_frame = frames.get_color_frame();
        if (!color_frame) {
            return GrabStatus::Miss;
        }

        ImageBuffer& image = out.image;
        image.width = color_frame.get_width();
        image.height = color_frame.get_height();
        image.channels = 3;
        image.data.resize(image.expected_size());

        // Rows may be padded
        const uint8_t* src = static_cast<const uint8_t*>(color_frame.get_data());
        const size_t row_bytes = static_cast<size_t>(image.width) * 3;
        const size_t stride = static_cast<size_t>(color_frame.get_stride_in_bytes());
        for (int y = 0; y < image.height; ++y) {
            std::memcpy(&image.data[y * row_bytes], src + y * stride, row_bytes);
        }

        out.depth = DepthBuffer();
        if (enable_depth_) {
            rs2::depth_frame depth_frame = frames.get_depth_frame();
            if (!depth_frame) {
                return GrabStatus::Miss;
            }
            DepthBuffer& depth = out.depth;
            depth.width = depth_frame.get_width();
            depth.height = depth_frame.get_height();
            depth.scale = depth_scale_;
            depth.data.resize(depth.expected_size());

            const uint8_t* dsrc = static_cast<const uint8_t*>(depth_frame.get_data());
            const size_t drow = static_cast<size_t>(depth.width) * sizeof(uint16_t);
            const size_t dstride = static_cast<size_t>(depth_frame.get_stride_in_bytes());
            for (int y = 0; y < depth.height; ++y) {
                std::memcpy(&depth.data[y * depth.width], dsrc + y * dstride, drow);
            }
        }
        return GrabStatus::Ok;

    } catch (const rs2::camera_disconnected_error& e) {
        std::cerr << "[source:realsense] Camera disconnected: " << e.what() << std::endl;
        return GrabStatus::Fatal;
    } catch (const rs2::error& e) {
        // Single bad frameset; the next grab may well succeed
        std::cerr << "[source:realsense] Frame capture error: " << e.what() << std::endl;
        return GrabStatus::Miss;
    }
}

void RealSenseSource::do_release() {
    if (pipeline_) {
        try {
            pipeline_->stop();
        } catch (const rs2::error& e) {
            std::cerr << "[source:realsense] Stop error: " << e.what() << std::endl;
        }
    }
    align_.reset();
    pipeline_.reset();
}

} // namespace framecast
