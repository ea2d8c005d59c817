#include "stream_config.hpp"

#include <algorithm>
#include <cctype>

namespace framecast {

bool parse_resolution_class(const std::string& text, ResolutionClass& out) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "vga") {
        out = ResolutionClass::VGA;
    } else if (lower == "720p") {
        out = ResolutionClass::HD720;
    } else if (lower == "1080p") {
        out = ResolutionClass::HD1080;
    } else if (lower == "2k") {
        out = ResolutionClass::HD2K;
    } else {
        return false;
    }
    return true;
}

const char* to_string(ResolutionClass res) {
    switch (res) {
        case ResolutionClass::VGA: return "vga";
        case ResolutionClass::HD720: return "720p";
        case ResolutionClass::HD1080: return "1080p";
        case ResolutionClass::HD2K: return "2k";
    }
    return "unknown";
}

Resolution resolution_size(ResolutionClass res) {
    switch (res) {
        case ResolutionClass::VGA: return {672, 376};
        case ResolutionClass::HD720: return {1280, 720};
        case ResolutionClass::HD1080: return {1920, 1080};
        case ResolutionClass::HD2K: return {2208, 1242};
    }
    return {1280, 720};
}

std::string bind_endpoint(const std::string& host, int port) {
    return "tcp://" + (host.empty() ? std::string("*") : host) + ":" + std::to_string(port);
}

std::string connect_endpoint(const std::string& host, int port) {
    return "tcp://" + host + ":" + std::to_string(port);
}

} // namespace framecast
