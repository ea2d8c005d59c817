#pragma once

#include <string>

namespace framecast {

enum class ResolutionClass {
    VGA,
    HD720,
    HD1080,
    HD2K,
};

struct Resolution {
    int width;
    int height;
};

bool parse_resolution_class(const std::string& text, ResolutionClass& out);
const char* to_string(ResolutionClass res);
Resolution resolution_size(ResolutionClass res);

// Fixed for the lifetime of a session.
struct StreamEndpointConfig {
    std::string host = "*";
    int port = 5556;
    ResolutionClass resolution = ResolutionClass::HD720;
    int fps = 30;
    bool enable_depth = false;
    std::string device_serial;  // Empty = use any device
};

std::string bind_endpoint(const std::string& host, int port);
std::string connect_endpoint(const std::string& host, int port);

} // namespace framecast
