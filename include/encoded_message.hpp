#pragma once

#include "frame.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace framecast {

enum class ImageEncoding : uint8_t {
    Raw = 0,
    Jpeg = 1,
};

const char* to_string(ImageEncoding encoding);

struct DepthPayload {
    uint32_t width = 0;
    uint32_t height = 0;
    float scale = 0.0f;
    std::vector<uint8_t> bytes;  // uint16 samples, host order
};

// One named camera stream inside a message.
struct StreamPayload {
    std::string stream_id;
    Timestamp captured_at;
    ImageEncoding encoding = ImageEncoding::Jpeg;
    uint32_t width = 0;
    uint32_t height = 0;
    uint8_t channels = 0;
    std::vector<uint8_t> image;

    bool has_depth = false;
    DepthPayload depth;
};

struct EncodedMessage {
    std::vector<StreamPayload> streams;

    bool empty() const { return streams.empty(); }
    const StreamPayload* find(const std::string& stream_id) const;
};

// Wire format: one self-contained binary message per publish.
//
// [4 bytes: magic 'FCST'] [2 bytes: version] [2 bytes: stream count]
// per stream:
//   [2 bytes: name length] [N bytes: name] [8 bytes: captured_at, f64 seconds]
//   [1 byte: encoding] [4 bytes: width] [4 bytes: height] [1 byte: channels]
//   [4 bytes: image length] [N bytes: image]
//   [1 byte: has_depth] and when set:
//   [4 bytes: depth width] [4 bytes: depth height] [4 bytes: depth scale, f32]
//   [4 bytes: depth length] [N bytes: depth samples]
constexpr uint32_t kWireMagic = 0x54534346;  // "FCST"
constexpr uint16_t kWireVersion = 1;
constexpr size_t kMaxStreamIdLength = 0xFFFF;  // u16 length prefix on the wire

size_t serialized_size(const EncodedMessage& message);

// Writes exactly serialized_size(message) bytes to out.
void serialize_message(const EncodedMessage& message, uint8_t* out);
std::vector<uint8_t> serialize_message(const EncodedMessage& message);

// Returns false on bad magic/version, truncation, trailing bytes or zero dimensions.
bool parse_message(const uint8_t* data, size_t size, EncodedMessage& out);

} // namespace framecast
