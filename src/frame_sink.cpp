#include "frame_sink.hpp"
#include "frame_codec.hpp"

#include <iomanip>
#include <iostream>
#include <vector>

namespace framecast {

namespace {

std::string depth_path_for(const std::string& path) {
    const auto slash = path.find_last_of('/');
    const auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + "_depth.pgm";
    }
    return path.substr(0, dot) + "_depth.pgm";
}

bool write_depth_pgm(const DepthBuffer& depth, const std::string& path) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        return false;
    }
    ofs << "P5\n" << depth.width << " " << depth.height << "\n65535\n";

    // PGM samples are big-endian
    std::vector<uint8_t> row(static_cast<size_t>(depth.width) * 2);
    for (int y = 0; y < depth.height; ++y) {
        for (int x = 0; x < depth.width; ++x) {
            const uint16_t v = depth.data[y * depth.width + x];
            row[x * 2] = static_cast<uint8_t>(v >> 8);
            row[x * 2 + 1] = static_cast<uint8_t>(v & 0xFF);
        }
        ofs.write(reinterpret_cast<const char*>(row.data()), row.size());
    }
    return ofs.good();
}

} // namespace

bool write_frame_files(const Frame& frame, const std::string& path, int jpeg_quality) {
    std::vector<uint8_t> jpeg;
    if (!encode_jpeg(frame.image, jpeg_quality, jpeg)) {
        return false;
    }

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        std::cerr << "[sink] Failed to open " << path << std::endl;
        return false;
    }
    ofs.write(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
    if (!ofs.good()) {
        return false;
    }

    if (frame.has_depth()) {
        const std::string depth_path = depth_path_for(path);
        if (!write_depth_pgm(frame.depth, depth_path)) {
            std::cerr << "[sink] Failed to write " << depth_path << std::endl;
            return false;
        }
    }
    return true;
}

ConsoleSink::ConsoleSink() : config_() {}

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::render(const Frame& frame, const RenderInfo& info) {
    rendered_count_++;

    const auto now = std::chrono::steady_clock::now();
    auto it = last_print_.find(info.stream_id);
    if (it != last_print_.end() && now - it->second < config_.report_interval) {
        return;
    }
    last_print_[info.stream_id] = now;

    std::cout << "[" << info.stream_id << "] "
              << frame.image.width << "x" << frame.image.height
              << (frame.has_depth() ? " +depth" : "")
              << " FPS: " << std::fixed << std::setprecision(1) << info.fps;
    if (info.has_latency) {
        std::cout << " Latency: " << std::setprecision(0)
                  << info.latency.count() / 1000.0 << "ms";
    }
    std::cout << std::endl;
}

bool ConsoleSink::persist(const Frame& frame, const std::string& path) {
    return write_frame_files(frame, path, config_.jpeg_quality);
}

MjpegFileSink::MjpegFileSink(const std::string& path, int jpeg_quality)
    : path_(path)
    , jpeg_quality_(jpeg_quality)
    , out_(path, std::ios::binary | std::ios::trunc)
{
    if (out_.is_open()) {
        std::cout << "[recorder] Recording to: " << path_ << std::endl;
    } else {
        std::cerr << "[recorder] Failed to open " << path_ << std::endl;
    }
}

MjpegFileSink::~MjpegFileSink() {
    close();
}

void MjpegFileSink::render(const Frame& frame, const RenderInfo&) {
    if (!out_.is_open()) {
        return;
    }
    std::vector<uint8_t> jpeg;
    if (!encode_jpeg(frame.image, jpeg_quality_, jpeg)) {
        failed_count_++;
        if (!warned_) {
            warned_ = true;
            std::cerr << "[recorder] Failed to encode frame for " << path_ << std::endl;
        }
        return;
    }
    out_.write(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
    if (out_.good()) {
        written_count_++;
    } else {
        failed_count_++;
        if (!warned_) {
            warned_ = true;
            std::cerr << "[recorder] Write failed: " << path_ << std::endl;
        }
    }
}

bool MjpegFileSink::persist(const Frame& frame, const std::string& path) {
    return write_frame_files(frame, path, jpeg_quality_);
}

void MjpegFileSink::close() {
    if (!out_.is_open()) {
        return;
    }
    out_.close();
    std::cout << "[recorder] Video saved: " << path_ << " (" << written_count_
              << " frames)" << std::endl;
}

} // namespace framecast
