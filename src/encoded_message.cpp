#include "encoded_message.hpp"

#include <cstring>
#include <utility>

namespace framecast {

namespace {

template <typename T>
uint8_t* put(uint8_t* ptr, T value) {
    std::memcpy(ptr, &value, sizeof(T));
    return ptr + sizeof(T);
}

uint8_t* put_bytes(uint8_t* ptr, const void* src, size_t n) {
    if (n > 0) {
        std::memcpy(ptr, src, n);
    }
    return ptr + n;
}

class Reader {
public:
    Reader(const uint8_t* data, size_t size) : ptr_(data), end_(data + size) {}

    template <typename T>
    bool get(T& value) {
        if (remaining() < sizeof(T)) {
            return false;
        }
        std::memcpy(&value, ptr_, sizeof(T));
        ptr_ += sizeof(T);
        return true;
    }

    bool get_bytes(std::vector<uint8_t>& out, size_t n) {
        if (remaining() < n) {
            return false;
        }
        out.assign(ptr_, ptr_ + n);
        ptr_ += n;
        return true;
    }

    bool get_string(std::string& out, size_t n) {
        if (remaining() < n) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(ptr_), n);
        ptr_ += n;
        return true;
    }

    size_t remaining() const { return static_cast<size_t>(end_ - ptr_); }

private:
    const uint8_t* ptr_;
    const uint8_t* end_;
};

size_t stream_size(const StreamPayload& s) {
    size_t size = sizeof(uint16_t) + s.stream_id.size()
                + sizeof(double)
                + sizeof(uint8_t) + sizeof(uint32_t) * 2 + sizeof(uint8_t)
                + sizeof(uint32_t) + s.image.size()
                + sizeof(uint8_t);
    if (s.has_depth) {
        size += sizeof(uint32_t) * 2 + sizeof(float) + sizeof(uint32_t) + s.depth.bytes.size();
    }
    return size;
}

bool parse_stream(Reader& in, StreamPayload& s) {
    uint16_t name_len = 0;
    if (!in.get(name_len) || !in.get_string(s.stream_id, name_len)) return false;

    double captured_at = 0.0;
    if (!in.get(captured_at)) return false;
    s.captured_at = from_epoch_seconds(captured_at);

    uint8_t encoding = 0;
    if (!in.get(encoding)) return false;
    if (encoding != static_cast<uint8_t>(ImageEncoding::Raw) &&
        encoding != static_cast<uint8_t>(ImageEncoding::Jpeg)) {
        return false;
    }
    s.encoding = static_cast<ImageEncoding>(encoding);

    if (!in.get(s.width) || !in.get(s.height) || !in.get(s.channels)) return false;
    if (s.width == 0 || s.height == 0 || s.channels == 0) return false;

    uint32_t image_len = 0;
    if (!in.get(image_len) || !in.get_bytes(s.image, image_len)) return false;

    uint8_t has_depth = 0;
    if (!in.get(has_depth)) return false;
    s.has_depth = has_depth != 0;
    if (s.has_depth) {
        uint32_t depth_len = 0;
        if (!in.get(s.depth.width) || !in.get(s.depth.height) ||
            !in.get(s.depth.scale) || !in.get(depth_len)) {
            return false;
        }
        if (s.depth.width == 0 || s.depth.height == 0) return false;
        if (!in.get_bytes(s.depth.bytes, depth_len)) return false;
    }
    return true;
}

} // namespace

const char* to_string(ImageEncoding encoding) {
    switch (encoding) {
        case ImageEncoding::Raw: return "raw";
        case ImageEncoding::Jpeg: return "jpeg";
    }
    return "unknown";
}

const StreamPayload* EncodedMessage::find(const std::string& stream_id) const {
    for (const auto& s : streams) {
        if (s.stream_id == stream_id) {
            return &s;
        }
    }
    return nullptr;
}

size_t serialized_size(const EncodedMessage& message) {
    size_t size = sizeof(uint32_t) + sizeof(uint16_t) * 2;
    for (const auto& s : message.streams) {
        size += stream_size(s);
    }
    return size;
}

void serialize_message(const EncodedMessage& message, uint8_t* out) {
    uint8_t* ptr = out;
    ptr = put(ptr, kWireMagic);
    ptr = put(ptr, kWireVersion);
    ptr = put(ptr, static_cast<uint16_t>(message.streams.size()));

    for (const auto& s : message.streams) {
        ptr = put(ptr, static_cast<uint16_t>(s.stream_id.size()));
        ptr = put_bytes(ptr, s.stream_id.data(), s.stream_id.size());
        ptr = put(ptr, to_epoch_seconds(s.captured_at));
        ptr = put(ptr, static_cast<uint8_t>(s.encoding));
        ptr = put(ptr, s.width);
        ptr = put(ptr, s.height);
        ptr = put(ptr, s.channels);
        ptr = put(ptr, static_cast<uint32_t>(s.image.size()));
        ptr = put_bytes(ptr, s.image.data(), s.image.size());
        ptr = put(ptr, static_cast<uint8_t>(s.has_depth ? 1 : 0));
        if (s.has_depth) {
            ptr = put(ptr, s.depth.width);
            ptr = put(ptr, s.depth.height);
            ptr = put(ptr, s.depth.scale);
            ptr = put(ptr, static_cast<uint32_t>(s.depth.bytes.size()));
            ptr = put_bytes(ptr, s.depth.bytes.data(), s.depth.bytes.size());
        }
    }
}

std::vector<uint8_t> serialize_message(const EncodedMessage& message) {
    std::vector<uint8_t> out(serialized_size(message));
    serialize_message(message, out.data());
    return out;
}

bool parse_message(const uint8_t* data, size_t size, EncodedMessage& out) {
    out.streams.clear();
    if (!data) {
        return false;
    }

    Reader in(data, size);
    uint32_t magic = 0;
    uint16_t version = 0;
    uint16_t count = 0;
    if (!in.get(magic) || !in.get(version) || !in.get(count)) return false;
    if (magic != kWireMagic || version != kWireVersion) return false;

    out.streams.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        StreamPayload s;
        if (!parse_stream(in, s)) {
            out.streams.clear();
            return false;
        }
        out.streams.push_back(std::move(s));
    }

    if (in.remaining() != 0) {
        out.streams.clear();
        return false;
    }
    return true;
}

} // namespace framecast
