#pragma once

#include "frame.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <string>

namespace framecast {

struct RenderInfo {
    std::string stream_id;
    double fps = 0.0;
    std::chrono::microseconds latency{0};
    bool has_latency = false;
};

class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void render(const Frame& frame, const RenderInfo& info) = 0;
    virtual bool persist(const Frame& frame, const std::string& path) = 0;
    virtual void close() {}
};

// Writes frame.image as a JPEG file, and frame.depth (if any) next to it as
// a 16-bit binary PGM with the same stem.
bool write_frame_files(const Frame& frame, const std::string& path, int jpeg_quality);

// Prints one status line per stream at most every report_interval.
class ConsoleSink : public FrameSink {
public:
    struct Config {
        std::chrono::milliseconds report_interval{2000};
        int jpeg_quality = 90;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void render(const Frame& frame, const RenderInfo& info) override;
    bool persist(const Frame& frame, const std::string& path) override;

    uint64_t get_rendered_count() const { return rendered_count_; }

private:
    Config config_;
    std::map<std::string, std::chrono::steady_clock::time_point> last_print_;
    uint64_t rendered_count_ = 0;
};

// Records rendered frames into a Motion-JPEG stream file.
class MjpegFileSink : public FrameSink {
public:
    MjpegFileSink(const std::string& path, int jpeg_quality);
    ~MjpegFileSink() override;

    bool is_open() const { return out_.is_open(); }

    void render(const Frame& frame, const RenderInfo& info) override;
    bool persist(const Frame& frame, const std::string& path) override;
    void close() override;

    uint64_t get_written_count() const { return written_count_; }
    uint64_t get_failed_count() const { return failed_count_; }

private:
    std::string path_;
    int jpeg_quality_;
    std::ofstream out_;
    uint64_t written_count_ = 0;
    uint64_t failed_count_ = 0;
    bool warned_ = false;  // log the first failure only
};

} // namespace framecast
