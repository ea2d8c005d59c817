#include "cli_options.hpp"

#include <ostream>
#include <stdexcept>

namespace framecast {

namespace {

// Value flags need a following argument.
bool take_value(int argc, const char* const argv[], int& i, std::string& value,
                std::string& error) {
    if (i + 1 >= argc) {
        error = std::string("missing value for ") + argv[i];
        return false;
    }
    value = argv[++i];
    return true;
}

bool to_int(const std::string& flag, const std::string& text, int lo, int hi, int& out,
            std::string& error) {
    try {
        size_t pos = 0;
        const int v = std::stoi(text, &pos);
        if (pos != text.size() || v < lo || v > hi) {
            throw std::out_of_range(text);
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        error = "invalid value for " + flag + ": " + text;
        return false;
    }
}

bool to_double(const std::string& flag, const std::string& text, double& out,
               std::string& error) {
    try {
        size_t pos = 0;
        const double v = std::stod(text, &pos);
        if (pos != text.size() || v < 0.0) {
            throw std::out_of_range(text);
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        error = "invalid value for " + flag + ": " + text;
        return false;
    }
}

} // namespace

bool parse_producer_args(int argc, const char* const argv[], ProducerOptions& out,
                         std::string& error) {
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        std::string value;
        int n = 0;

        if (arg == "--help" || arg == "-h") {
            out.show_help = true;
        } else if (arg == "--depth") {
            out.endpoint.enable_depth = true;
        } else if (arg == "--display") {
            out.display = true;
        } else if (arg == "--resolution") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!parse_resolution_class(value, out.endpoint.resolution)) {
                error = "unknown resolution: " + value + " (vga, 720p, 1080p, 2k)";
                return false;
            }
        } else if (arg == "--fps") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_int(arg, value, 1, 120, out.endpoint.fps, error)) return false;
        } else if (arg == "--serial") {
            if (!take_value(argc, argv, i, out.endpoint.device_serial, error)) return false;
        } else if (arg == "--port") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_int(arg, value, 0, 65535, out.endpoint.port, error)) return false;
        } else if (arg == "--bind") {
            if (!take_value(argc, argv, i, out.endpoint.host, error)) return false;
        } else if (arg == "--save") {
            if (!take_value(argc, argv, i, out.save_path, error)) return false;
        } else if (arg == "--duration") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_double(arg, value, out.duration_s, error)) return false;
        } else if (arg == "--frames") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_int(arg, value, 0, 1 << 30, n, error)) return false;
            out.max_frames = static_cast<uint64_t>(n);
        } else if (arg == "--source") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!parse_source_kind(value, out.source)) {
                error = "unknown source: " + value + " (realsense, pattern)";
                return false;
            }
        } else if (arg == "--quality") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_int(arg, value, 1, 100, out.codec.jpeg_quality, error)) return false;
        } else if (arg == "--encoding") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (value == "jpeg") {
                out.codec.encoding = ImageEncoding::Jpeg;
            } else if (value == "raw") {
                out.codec.encoding = ImageEncoding::Raw;
            } else {
                error = "unknown encoding: " + value + " (jpeg, raw)";
                return false;
            }
        } else if (arg == "--stream-name") {
            if (!take_value(argc, argv, i, out.stream_name, error)) return false;
            if (out.stream_name.empty() || out.stream_name.size() > kMaxStreamIdLength) {
                error = "invalid stream name";
                return false;
            }
        } else if (arg == "--hwm") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_int(arg, value, 1, 3, out.high_water_mark, error)) return false;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }
    return true;
}

bool parse_consumer_args(int argc, const char* const argv[], ConsumerOptions& out,
                         std::string& error) {
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        std::string value;

        if (arg == "--help" || arg == "-h") {
            out.show_help = true;
        } else if (arg == "--save") {
            out.save = true;
        } else if (arg == "--no-keyboard") {
            out.keyboard = false;
        } else if (arg == "--ip") {
            if (!take_value(argc, argv, i, out.ip, error)) return false;
        } else if (arg == "--port") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_int(arg, value, 1, 65535, out.port, error)) return false;
        } else if (arg == "--save-dir") {
            if (!take_value(argc, argv, i, out.save_dir, error)) return false;
        } else if (arg == "--timeout-ms") {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!to_int(arg, value, 1, 3600000, out.timeout_ms, error)) return false;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }
    return true;
}

void print_producer_usage(std::ostream& os, const char* argv0) {
    os << "Frame producer: capture and publish camera frames\n"
       << "Usage: " << argv0 << " [options]\n"
       << "Options:\n"
       << "  --resolution R    vga, 720p, 1080p or 2k (default: 720p)\n"
       << "  --fps N           Target frames per second (default: 30)\n"
       << "  --depth           Capture depth alongside the image\n"
       << "  --serial S        Device serial number (multi-camera)\n"
       << "  --source S        realsense or pattern (default: realsense)\n"
       << "  --port N          Publisher port, 0 disables (default: 5556)\n"
       << "  --bind ADDR       Bind address (default: *)\n"
       << "  --hwm N           Send high water mark 1-3 (default: 1)\n"
       << "  --encoding E      jpeg or raw (default: jpeg)\n"
       << "  --quality N       JPEG quality 1-100 (default: 85)\n"
       << "  --stream-name S   Stream name on the wire (default: ego_view)\n"
       << "  --display         Print a local preview status line\n"
       << "  --save PATH       Record a Motion-JPEG file\n"
       << "  --duration S      Stop after S seconds\n"
       << "  --frames N        Stop after N frames\n"
       << "  --help            Show this help\n";
}

void print_consumer_usage(std::ostream& os, const char* argv0) {
    os << "Frame consumer: view a published camera stream\n"
       << "Usage: " << argv0 << " [options]\n"
       << "Options:\n"
       << "  --ip ADDR         Producer address (default: 192.168.123.164)\n"
       << "  --port N          Producer port (default: 5555)\n"
       << "  --save            Enable frame saving\n"
       << "  --save-dir DIR    Directory to save frames (default: ./captured_frames)\n"
       << "  --timeout-ms N    Receive timeout (default: 5000)\n"
       << "  --no-keyboard     Ignore the terminal ('s' save toggle, 'q' quit)\n"
       << "  --help            Show this help\n";
}

} // namespace framecast
