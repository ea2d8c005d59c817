#include "frame_publisher.hpp"

#include <iostream>

namespace framecast {

FramePublisher::FramePublisher(const Config& config)
    : config_(config)
{
    if (config_.endpoint.empty()) {
        std::cout << "[publisher] Disabled, frames will be dropped" << std::endl;
        return;
    }

    context_ = std::make_unique<zmq::context_t>(1);
    socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

    // Set high water mark (drop old frames if subscriber slow)
    socket_->setsockopt(ZMQ_SNDHWM, config_.high_water_mark);
    socket_->setsockopt(ZMQ_LINGER, config_.linger_ms);
    if (config_.conflate) {
        // Keep only the last message in the outbound queue
        socket_->setsockopt(ZMQ_CONFLATE, 1);
    }

    // Bind to endpoint
    socket_->bind(config_.endpoint);

    char last_endpoint[256] = {0};
    size_t len = sizeof(last_endpoint);
    socket_->getsockopt(ZMQ_LAST_ENDPOINT, last_endpoint, &len);
    bound_endpoint_ = last_endpoint;

    std::cout << "[publisher] Bound to: " << bound_endpoint_
              << " (hwm=" << config_.high_water_mark
              << ", conflate=" << (config_.conflate ? "on" : "off") << ")" << std::endl;
}

FramePublisher::~FramePublisher() {
    close();
}

void FramePublisher::close() {
    if (!socket_) {
        return;
    }

    socket_->close();
    socket_.reset();
    context_->close();
    context_.reset();

    std::cout << "[publisher] Released " << bound_endpoint_
              << ". Published=" << published_count_
              << " Dropped=" << dropped_count_ << std::endl;
}

bool FramePublisher::publish(const EncodedMessage& message) {
    if (!socket_) {
        dropped_count_++;
        return false;
    }

    try {
        zmq::message_t msg(serialized_size(message));
        serialize_message(message, static_cast<uint8_t*>(msg.data()));

        // Send with DONTWAIT (non-blocking)
        auto result = socket_->send(msg, zmq::send_flags::dontwait);

        if (result) {
            published_count_++;
            return true;
        } else {
            dropped_count_++;
            return false;
        }

    } catch (const zmq::error_t& e) {
        std::cerr << "[publisher] ZMQ publish error: " << e.what() << std::endl;
        dropped_count_++;
        return false;
    }
}

} // namespace framecast
