#include "frame_subscriber.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace framecast {

const char* to_string(ReceiveStatus status) {
    switch (status) {
        case ReceiveStatus::Ok: return "ok";
        case ReceiveStatus::Timeout: return "timeout";
        case ReceiveStatus::Corrupt: return "corrupt";
        case ReceiveStatus::Closed: return "closed";
    }
    return "unknown";
}

FrameSubscriber::FrameSubscriber(const Config& config)
    : config_(config)
    , context_(std::make_unique<zmq::context_t>(1))
    , socket_(std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub))
{
    socket_->setsockopt(ZMQ_SUBSCRIBE, "", 0);
    socket_->setsockopt(ZMQ_RCVHWM, config_.high_water_mark);
    socket_->setsockopt(ZMQ_LINGER, config_.linger_ms);
    if (config_.conflate) {
        // Only keep latest message
        socket_->setsockopt(ZMQ_CONFLATE, 1);
    }

    socket_->connect(config_.endpoint);

    std::cout << "[subscriber] Connecting to " << config_.endpoint << std::endl;
}

FrameSubscriber::~FrameSubscriber() {
    close();
}

void FrameSubscriber::close() {
    if (!socket_) {
        return;
    }

    socket_->close();
    socket_.reset();
    context_->close();
    context_.reset();

    std::cout << "[subscriber] Released " << config_.endpoint
              << ". Received=" << received_count_
              << " Discarded=" << discarded_count_
              << " Corrupt=" << corrupt_count_ << std::endl;
}

bool FrameSubscriber::drain_latest(zmq::message_t& latest) {
    bool got = false;
    zmq::message_t msg;
    while (socket_->recv(msg, zmq::recv_flags::dontwait)) {
        if (got) {
            discarded_count_++;
        }
        latest.swap(msg);
        got = true;
    }
    return got;
}

bool FrameSubscriber::drop_stale_streams(EncodedMessage& message) {
    auto& streams = message.streams;
    if (streams.empty()) {
        return true;
    }
    for (auto it = streams.begin(); it != streams.end();) {
        auto seen = last_seen_.find(it->stream_id);
        if (seen != last_seen_.end() && it->captured_at < seen->second) {
            it = streams.erase(it);
        } else {
            ++it;
        }
    }
    if (streams.empty()) {
        return false;
    }
    for (const auto& s : streams) {
        last_seen_[s.stream_id] = s.captured_at;
    }
    return true;
}

ReceiveStatus FrameSubscriber::receive(EncodedMessage& out, std::chrono::milliseconds timeout) {
    using namespace std::chrono;

    if (!socket_) {
        return ReceiveStatus::Closed;
    }

    const auto deadline = steady_clock::now() + timeout;

    while (true) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() < 0) {
            remaining = milliseconds(0);
        }

        zmq::pollitem_t items[] = {
            {static_cast<void*>(*socket_), 0, ZMQ_POLLIN, 0},
        };

        try {
            zmq::poll(items, 1, remaining);
        } catch (const zmq::error_t& e) {
            if (e.num() == EINTR) {
                return ReceiveStatus::Timeout;
            }
            std::cerr << "[subscriber] ZMQ poll error: " << e.what() << std::endl;
            return ReceiveStatus::Closed;
        }

        if (!(items[0].revents & ZMQ_POLLIN)) {
            return ReceiveStatus::Timeout;
        }

        zmq::message_t latest;
        if (drain_latest(latest)) {
            EncodedMessage message;
            if (!parse_message(static_cast<const uint8_t*>(latest.data()), latest.size(), message)) {
                corrupt_count_++;
                return ReceiveStatus::Corrupt;
            }

            if (drop_stale_streams(message)) {
                out = std::move(message);
                received_count_++;
                return ReceiveStatus::Ok;
            }
            discarded_count_++;
        }

        if (steady_clock::now() >= deadline) {
            return ReceiveStatus::Timeout;
        }
    }
}

} // namespace framecast
