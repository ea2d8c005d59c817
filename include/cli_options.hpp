#pragma once

#include "frame_codec.hpp"
#include "frame_source.hpp"
#include "stream_config.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace framecast {

struct ProducerOptions {
    StreamEndpointConfig endpoint;
    SourceKind source = SourceKind::RealSense;
    FrameCodec::Config codec;
    std::string stream_name = "ego_view";
    int high_water_mark = 1;
    bool display = false;
    std::string save_path;   // Empty = no recording
    double duration_s = 0.0; // 0 = run until interrupted
    uint64_t max_frames = 0;
    bool show_help = false;
};

struct ConsumerOptions {
    std::string ip = "192.168.123.164";
    int port = 5555;
    bool save = false;
    std::string save_dir = "./captured_frames";
    int timeout_ms = 5000;
    bool keyboard = true;
    bool show_help = false;
};

// Both return false and fill `error` on unknown flags or bad values.
bool parse_producer_args(int argc, const char* const argv[], ProducerOptions& out, std::string& error);
bool parse_consumer_args(int argc, const char* const argv[], ConsumerOptions& out, std::string& error);

void print_producer_usage(std::ostream& os, const char* argv0);
void print_consumer_usage(std::ostream& os, const char* argv0);

} // namespace framecast
