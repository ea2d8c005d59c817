#pragma once

#include "encoded_message.hpp"

#include <zmq.hpp>
#include <cstdint>
#include <string>
#include <memory>

namespace framecast {

// PUB side of the frame channel. Keeps at most the newest frame buffered:
// a stale frame is worth less than a dropped one.
class FramePublisher {
public:
    struct Config {
        std::string endpoint = "tcp://*:5556";  // Empty = publishing disabled
        int high_water_mark = 1;  // Drop old frames if subscriber is slow
        bool conflate = true;
        int linger_ms = 0;
    };

    // Binds immediately; throws zmq::error_t if the endpoint can't be bound.
    explicit FramePublisher(const Config& config);
    ~FramePublisher();

    FramePublisher(const FramePublisher&) = delete;
    FramePublisher& operator=(const FramePublisher&) = delete;

    // Never blocks. Counts a drop (no error) when nothing is bound.
    bool publish(const EncodedMessage& message);

    // Releases socket and context. Safe to call more than once.
    void close();

    bool is_bound() const { return socket_ != nullptr; }
    const std::string& endpoint() const { return bound_endpoint_; }

    // Statistics
    uint64_t get_published_count() const { return published_count_; }
    uint64_t get_dropped_count() const { return dropped_count_; }

private:
    Config config_;
    std::string bound_endpoint_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> socket_;
    uint64_t published_count_{0};
    uint64_t dropped_count_{0};
};

} // namespace framecast
