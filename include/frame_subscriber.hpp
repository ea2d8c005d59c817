#pragma once

#include "encoded_message.hpp"

#include <zmq.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace framecast {

enum class ReceiveStatus {
    Ok,
    Timeout,  // nothing fresh arrived before the deadline
    Corrupt,  // newest message failed to parse
    Closed,
};

const char* to_string(ReceiveStatus status);

// SUB side of the frame channel. Only the newest pending message is ever
// delivered; anything older is discarded on the way.
class FrameSubscriber {
public:
    struct Config {
        std::string endpoint = "tcp://127.0.0.1:5555";
        int high_water_mark = 3;
        bool conflate = true;
        int linger_ms = 0;
    };

    // Connects immediately; throws zmq::error_t on a malformed endpoint.
    explicit FrameSubscriber(const Config& config);
    ~FrameSubscriber();

    FrameSubscriber(const FrameSubscriber&) = delete;
    FrameSubscriber& operator=(const FrameSubscriber&) = delete;

    // Waits up to timeout. Never retries internally.
    ReceiveStatus receive(EncodedMessage& out, std::chrono::milliseconds timeout);

    void close();
    bool is_connected() const { return socket_ != nullptr; }
    const std::string& endpoint() const { return config_.endpoint; }

    // Statistics
    uint64_t get_received_count() const { return received_count_; }
    uint64_t get_discarded_count() const { return discarded_count_; }
    uint64_t get_corrupt_count() const { return corrupt_count_; }

private:
    bool drain_latest(zmq::message_t& latest);
    bool drop_stale_streams(EncodedMessage& message);

    Config config_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> socket_;

    // Newest captured_at delivered so far, per stream
    std::map<std::string, Timestamp> last_seen_;

    uint64_t received_count_{0};
    uint64_t discarded_count_{0};
    uint64_t corrupt_count_{0};
};

} // namespace framecast
