#pragma once

#include "encoded_message.hpp"
#include "frame.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace framecast {

enum class DecodeStatus {
    Ok,
    Mismatch,  // payload geometry disagrees with its header
    Corrupt,   // payload could not be decoded at all
};

const char* to_string(DecodeStatus status);

// Pure in-memory transform between Frame and StreamPayload. No I/O.
// Depth is always carried raw so it round-trips bit-exact.
class FrameCodec {
public:
    struct Config {
        ImageEncoding encoding = ImageEncoding::Jpeg;
        int jpeg_quality = 85;
    };

    FrameCodec();
    explicit FrameCodec(const Config& config);

    bool encode(const Frame& frame, const std::string& stream_id, StreamPayload& out) const;
    DecodeStatus decode(const StreamPayload& payload, Frame& out) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

// libjpeg helpers, also used by the file sinks.
bool encode_jpeg(const ImageBuffer& image, int quality, std::vector<uint8_t>& output);
// Fails with Mismatch, before decoding, if the JPEG is not width x height.
DecodeStatus decode_jpeg(const uint8_t* data, size_t size, int width, int height, int channels,
                         ImageBuffer& output);

} // namespace framecast
