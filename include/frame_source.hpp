#pragma once

#include "frame.hpp"
#include "stream_config.hpp"

#include <memory>
#include <string>

namespace framecast {

enum class GrabStatus {
    Ok,
    Miss,   // one frame missed, try again next iteration
    Fatal,  // device is gone
};

const char* to_string(GrabStatus status);

// A sensor device. open() and close() wrap the device handle; close() runs
// the release exactly once no matter how often it is called. Derived classes
// must call close() from their own destructor.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    bool open(const StreamEndpointConfig& config);
    GrabStatus grab(Frame& out, int timeout_ms);
    void close();

    bool is_open() const { return open_; }
    virtual const char* name() const = 0;

protected:
    virtual bool do_open(const StreamEndpointConfig& config) = 0;
    virtual GrabStatus do_grab(Frame& out, int timeout_ms) = 0;
    virtual void do_release() = 0;

private:
    bool open_ = false;
};

enum class SourceKind {
    RealSense,
    Pattern,
};

bool parse_source_kind(const std::string& text, SourceKind& out);
const char* to_string(SourceKind kind);

std::unique_ptr<FrameSource> make_frame_source(SourceKind kind);

} // namespace framecast
