#include "frame_codec.hpp"

#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// jpeglib.h needs stdio declared first
extern "C" {
#include <jpeglib.h>
}

namespace framecast {

namespace {

// libjpeg's default error_exit calls exit(); jump back to the caller instead.
// Also holds the compress destination so it is still valid after longjmp.
struct JpegErrorManager {
    struct jpeg_error_mgr pub;
    std::jmp_buf jump;
    unsigned char* mem = nullptr;
    unsigned long mem_size = 0;
};

// Larger than any supported sensor mode; guards the output allocation.
constexpr unsigned int kMaxImageDimension = 8192;

void clear_image(ImageBuffer& image) {
    image.data.clear();
    image.width = 0;
    image.height = 0;
    image.channels = 0;
}

void jpeg_error_exit(j_common_ptr cinfo) {
    JpegErrorManager* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    std::longjmp(err->jump, 1);
}

void jpeg_silent_message(j_common_ptr) {}

} // namespace

const char* to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok: return "ok";
        case DecodeStatus::Mismatch: return "mismatch";
        case DecodeStatus::Corrupt: return "corrupt";
    }
    return "unknown";
}

bool encode_jpeg(const ImageBuffer& image, int quality, std::vector<uint8_t>& output) {
    if (image.channels != 1 && image.channels != 3) {
        return false;
    }
    if (image.width <= 0 || image.height <= 0 || image.data.size() < image.expected_size()) {
        return false;
    }

    const uint8_t* data = image.data.data();

    // Setup JPEG compression
    struct jpeg_compress_struct cinfo;
    JpegErrorManager jerr;

    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_message;

    if (setjmp(jerr.jump)) {
        jpeg_destroy_compress(&cinfo);
        std::free(jerr.mem);
        return false;
    }

    jpeg_create_compress(&cinfo);

    // Output to memory
    jpeg_mem_dest(&cinfo, &jerr.mem, &jerr.mem_size);

    cinfo.image_width = image.width;
    cinfo.image_height = image.height;
    cinfo.input_components = image.channels;
    cinfo.in_color_space = image.channels == 3 ? JCS_RGB : JCS_GRAYSCALE;

    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);

    // Fast compression for real-time
    cinfo.dct_method = JDCT_FASTEST;

    jpeg_start_compress(&cinfo, TRUE);

    // Write scanlines
    JSAMPROW row_pointer[1];
    const size_t row_stride = static_cast<size_t>(image.width) * image.channels;

    while (cinfo.next_scanline < cinfo.image_height) {
        row_pointer[0] = const_cast<JSAMPROW>(&data[cinfo.next_scanline * row_stride]);
        jpeg_write_scanlines(&cinfo, row_pointer, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    // Copy to output vector
    output.assign(jerr.mem, jerr.mem + jerr.mem_size);
    std::free(jerr.mem);

    return !output.empty();
}

DecodeStatus decode_jpeg(const uint8_t* data, size_t size, int width, int height, int channels,
                         ImageBuffer& output) {
    clear_image(output);
    if (!data || size == 0 || (channels != 1 && channels != 3)) {
        return DecodeStatus::Corrupt;
    }
    if (width <= 0 || height <= 0 ||
        static_cast<unsigned int>(width) > kMaxImageDimension ||
        static_cast<unsigned int>(height) > kMaxImageDimension) {
        return DecodeStatus::Mismatch;
    }

    struct jpeg_decompress_struct cinfo;
    JpegErrorManager jerr;

    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_message;

    if (setjmp(jerr.jump)) {
        jpeg_destroy_decompress(&cinfo);
        clear_image(output);
        return DecodeStatus::Corrupt;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, data, static_cast<unsigned long>(size));

    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        jpeg_destroy_decompress(&cinfo);
        return DecodeStatus::Corrupt;
    }

    // Check against the payload header before anything is allocated
    if (cinfo.image_width != static_cast<JDIMENSION>(width) ||
        cinfo.image_height != static_cast<JDIMENSION>(height)) {
        jpeg_destroy_decompress(&cinfo);
        return DecodeStatus::Mismatch;
    }

    cinfo.out_color_space = channels == 3 ? JCS_RGB : JCS_GRAYSCALE;
    cinfo.dct_method = JDCT_FASTEST;
    jpeg_start_decompress(&cinfo);

    output.width = static_cast<int>(cinfo.output_width);
    output.height = static_cast<int>(cinfo.output_height);
    output.channels = static_cast<int>(cinfo.output_components);
    output.data.resize(output.expected_size());

    const size_t row_stride = static_cast<size_t>(output.width) * output.channels;
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row_pointer[1];
        row_pointer[0] = &output.data[cinfo.output_scanline * row_stride];
        jpeg_read_scanlines(&cinfo, row_pointer, 1);
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return DecodeStatus::Ok;
}

FrameCodec::FrameCodec() : config_() {}

FrameCodec::FrameCodec(const Config& config) : config_(config) {}

bool FrameCodec::encode(const Frame& frame, const std::string& stream_id,
                        StreamPayload& out) const {
    if (stream_id.empty() || stream_id.size() > kMaxStreamIdLength) {
        return false;
    }

    const ImageBuffer& image = frame.image;
    if (image.width <= 0 || image.height <= 0 || image.channels <= 0 ||
        image.data.size() != image.expected_size()) {
        return false;
    }

    out.stream_id = stream_id;
    out.captured_at = frame.captured_at;
    out.encoding = config_.encoding;
    out.width = static_cast<uint32_t>(image.width);
    out.height = static_cast<uint32_t>(image.height);
    out.channels = static_cast<uint8_t>(image.channels);

    if (config_.encoding == ImageEncoding::Jpeg) {
        if (!encode_jpeg(image, config_.jpeg_quality, out.image)) {
            return false;
        }
    } else {
        out.image = image.data;
    }

    out.has_depth = frame.has_depth();
    out.depth = DepthPayload();
    if (out.has_depth) {
        const DepthBuffer& depth = frame.depth;
        if (depth.data.size() != depth.expected_size()) {
            return false;
        }
        out.depth.width = static_cast<uint32_t>(depth.width);
        out.depth.height = static_cast<uint32_t>(depth.height);
        out.depth.scale = depth.scale;
        out.depth.bytes.resize(depth.data.size() * sizeof(uint16_t));
        std::memcpy(out.depth.bytes.data(), depth.data.data(), out.depth.bytes.size());
    }
    return true;
}

DecodeStatus FrameCodec::decode(const StreamPayload& payload, Frame& out) const {
    out.captured_at = payload.captured_at;
    out.depth = DepthBuffer();

    if (payload.encoding == ImageEncoding::Jpeg) {
        const DecodeStatus status = decode_jpeg(payload.image.data(), payload.image.size(),
                                                static_cast<int>(payload.width),
                                                static_cast<int>(payload.height),
                                                payload.channels, out.image);
        if (status != DecodeStatus::Ok) {
            return status;
        }
    } else {
        out.image.width = static_cast<int>(payload.width);
        out.image.height = static_cast<int>(payload.height);
        out.image.channels = payload.channels;
        if (payload.image.size() != out.image.expected_size()) {
            return DecodeStatus::Mismatch;
        }
        out.image.data = payload.image;
    }

    if (out.image.width != static_cast<int>(payload.width) ||
        out.image.height != static_cast<int>(payload.height) ||
        out.image.channels != payload.channels) {
        return DecodeStatus::Mismatch;
    }

    if (payload.has_depth) {
        if (payload.depth.width != payload.width || payload.depth.height != payload.height) {
            return DecodeStatus::Mismatch;
        }
        DepthBuffer& depth = out.depth;
        depth.width = static_cast<int>(payload.depth.width);
        depth.height = static_cast<int>(payload.depth.height);
        depth.scale = payload.depth.scale;
        if (payload.depth.bytes.size() != depth.expected_size() * sizeof(uint16_t)) {
            return DecodeStatus::Mismatch;
        }
        depth.data.resize(depth.expected_size());
        std::memcpy(depth.data.data(), payload.depth.bytes.data(), payload.depth.bytes.size());
    }
    return DecodeStatus::Ok;
}

} // namespace framecast
