#include "stream_session.hpp"

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace framecast {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Streaming: return "streaming";
        case SessionState::Stopping: return "stopping";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ProducerSession

ProducerSession::ProducerSession(const Config& config,
                                 const StreamEndpointConfig& endpoint,
                                 std::unique_ptr<FrameSource> source,
                                 std::unique_ptr<FramePublisher> publisher,
                                 const FrameCodec& codec)
    : config_(config)
    , endpoint_(endpoint)
    , source_(std::move(source))
    , publisher_(std::move(publisher))
    , codec_(codec)
{
}

ProducerSession::~ProducerSession() {
    stop();
}

void ProducerSession::add_sink(std::unique_ptr<FrameSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

bool ProducerSession::start() {
    if (state_ != SessionState::Idle) {
        return state_ == SessionState::Streaming;
    }

    if (!publisher_) {
        std::cerr << "[producer] No publisher configured" << std::endl;
        stop();
        return false;
    }

    if (!source_ || !source_->open(endpoint_)) {
        std::cerr << "[producer] Failed to open frame source" << std::endl;
        stop();
        return false;
    }

    started_at_ = std::chrono::steady_clock::now();
    last_report_ = started_at_;
    state_ = SessionState::Streaming;
    std::cout << "[producer] Streaming started (" << config_.stream_id
              << ", " << to_string(codec_.config().encoding) << "). Press Ctrl+C to stop."
              << std::endl;
    return true;
}

bool ProducerSession::should_continue(const std::atomic<bool>& running) const {
    if (!running || stop_requested_) {
        return false;
    }
    if (config_.max_frames > 0 && frame_count_ >= config_.max_frames) {
        return false;
    }
    if (config_.duration_s > 0.0) {
        const std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - started_at_;
        if (elapsed.count() > config_.duration_s) {
            return false;
        }
    }
    return true;
}

void ProducerSession::run(const std::atomic<bool>& running) {
    if (state_ != SessionState::Streaming) {
        return;
    }

    Frame frame;
    while (should_continue(running)) {
        const GrabStatus status = source_->grab(frame, config_.grab_timeout_ms);
        if (status == GrabStatus::Fatal) {
            std::cerr << "[producer] Device error, stopping" << std::endl;
            break;
        }
        if (status == GrabStatus::Miss) {
            if (missed_count_++ % 30 == 0) {
                std::cerr << "[producer] Missed frame (total " << missed_count_ << ")" << std::endl;
            }
            continue;
        }

        frame_count_++;
        metrics_.record_arrival(frame.captured_at);

        EncodedMessage message;
        message.streams.resize(1);
        if (codec_.encode(frame, config_.stream_id, message.streams[0])) {
            publisher_->publish(message);
        } else {
            encode_failures_++;
            std::cerr << "[producer] Encode failed for frame " << frame_count_ << std::endl;
        }

        if (!sinks_.empty()) {
            RenderInfo info;
            info.stream_id = config_.stream_id;
            info.fps = metrics_.current_fps();
            for (auto& sink : sinks_) {
                sink->render(frame, info);
            }
        }

        if (std::chrono::steady_clock::now() - last_report_ >= config_.report_interval) {
            report();
        }
    }

    stop();
}

void ProducerSession::report() {
    last_report_ = std::chrono::steady_clock::now();
    std::cout << "[producer] FPS: " << std::fixed << std::setprecision(1) << metrics_.current_fps()
              << " Captured=" << frame_count_
              << " Published=" << publisher_->get_published_count()
              << " Dropped=" << publisher_->get_dropped_count()
              << " Missed=" << missed_count_ << std::endl;
}

void ProducerSession::stop() {
    SessionState expected = SessionState::Streaming;
    if (!state_.compare_exchange_strong(expected, SessionState::Stopping)) {
        expected = SessionState::Idle;
        if (!state_.compare_exchange_strong(expected, SessionState::Stopping)) {
            return;
        }
    }

    std::string released;
    if (source_ && source_->is_open()) {
        source_->close();
        released += std::string(" device(") + source_->name() + ")";
    }
    if (publisher_ && publisher_->is_bound()) {
        const std::string endpoint = publisher_->endpoint();
        publisher_->close();
        released += " publisher(" + endpoint + ")";
    }
    for (auto& sink : sinks_) {
        sink->close();
    }
    if (!sinks_.empty()) {
        released += " sinks(" + std::to_string(sinks_.size()) + ")";
    }

    state_ = SessionState::Closed;
    std::cout << "[producer] Shutdown complete. Frames=" << frame_count_
              << " Released:" << (released.empty() ? " nothing" : released) << std::endl;
}

// ---------------------------------------------------------------------------
// ConsumerSession

ConsumerSession::ConsumerSession(const Config& config,
                                 std::unique_ptr<FrameSubscriber> subscriber,
                                 const FrameCodec& codec,
                                 std::unique_ptr<FrameSink> sink)
    : config_(config)
    , subscriber_(std::move(subscriber))
    , codec_(codec)
    , sink_(std::move(sink))
{
}

ConsumerSession::~ConsumerSession() {
    stop();
}

bool ConsumerSession::start() {
    if (state_ != SessionState::Idle) {
        return state_ == SessionState::Streaming;
    }

    if (!subscriber_ || !subscriber_->is_connected()) {
        std::cerr << "[consumer] No subscriber connected" << std::endl;
        stop();
        return false;
    }

    if (config_.save_enabled && !enable_save(config_.save_dir)) {
        stop();
        return false;
    }

    last_report_ = std::chrono::steady_clock::now();
    state_ = SessionState::Streaming;
    return true;
}

bool ConsumerSession::enable_save(const std::string& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[consumer] Cannot create " << dir << ": " << ec.message() << std::endl;
        return false;
    }
    save_dir_ = dir;
    saving_ = true;
    std::cout << "[consumer] Saving frames to: " << save_dir_ << std::endl;
    return true;
}

void ConsumerSession::handle_key(int key) {
    if (key == 'q' || key == 27) {
        request_stop();
    } else if (key == 's') {
        if (saving_) {
            disable_save();
        } else if (!enable_save(save_dir_.empty() ? config_.save_dir : save_dir_)) {
            return;
        }
        std::cout << "[consumer] Frame saving: " << (saving_ ? "ON" : "OFF") << std::endl;
    }
}

bool ConsumerSession::last_latency(const std::string& stream_id,
                                   std::chrono::microseconds& out) const {
    auto it = last_latency_.find(stream_id);
    if (it == last_latency_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool ConsumerSession::check_geometry(const std::string& stream_id, const Frame& frame) {
    const std::pair<int, int> size(frame.image.width, frame.image.height);
    auto it = geometry_.find(stream_id);
    if (it == geometry_.end()) {
        geometry_.emplace(stream_id, size);
        return true;
    }
    return it->second == size;
}

void ConsumerSession::handle_message(const EncodedMessage& message) {
    const Timestamp now = now_timestamp();
    metrics_.record_arrival(now);
    message_count_++;

    if (message.empty()) {
        std::cerr << "[consumer] No images in frame" << std::endl;
        return;
    }

    const double fps = metrics_.current_fps();

    for (const auto& payload : message.streams) {
        Frame frame;
        const DecodeStatus status = codec_.decode(payload, frame);
        if (status != DecodeStatus::Ok || !check_geometry(payload.stream_id, frame)) {
            mismatch_count_++;
            std::cerr << "[consumer] Dropped " << payload.stream_id << " frame ("
                      << (status == DecodeStatus::Ok ? "geometry changed" : to_string(status))
                      << ")" << std::endl;
            continue;
        }

        RenderInfo info;
        info.stream_id = payload.stream_id;
        info.fps = fps;
        info.latency = MetricsTracker::latency(frame.captured_at, now);
        info.has_latency = true;
        last_latency_[payload.stream_id] = info.latency;

        if (sink_) {
            sink_->render(frame, info);
        }

        if (saving_ && sink_) {
            char suffix[32];
            std::snprintf(suffix, sizeof(suffix), "_%06llu.jpg",
                          static_cast<unsigned long long>(frame_count_));
            const std::string path = save_dir_ + "/" + payload.stream_id + suffix;
            if (sink_->persist(frame, path)) {
                saved_count_++;
            } else {
                std::cerr << "[consumer] Failed to save " << path << std::endl;
            }
        }
    }

    frame_count_++;
}

ReceiveStatus ConsumerSession::step() {
    if (state_ != SessionState::Streaming) {
        return ReceiveStatus::Closed;
    }

    EncodedMessage message;
    const ReceiveStatus status = subscriber_->receive(message, config_.receive_timeout);
    switch (status) {
        case ReceiveStatus::Ok:
            handle_message(message);
            break;
        case ReceiveStatus::Timeout:
            timeout_count_++;
            std::cerr << "[consumer] Timeout waiting for frame" << std::endl;
            break;
        case ReceiveStatus::Corrupt:
            corrupt_count_++;
            std::cerr << "[consumer] Dropped corrupt message" << std::endl;
            break;
        case ReceiveStatus::Closed:
            break;
    }

    if (keyboard_) {
        for (int key = keyboard_->poll_key(); key >= 0; key = keyboard_->poll_key()) {
            handle_key(key);
        }
    }

    if (std::chrono::steady_clock::now() - last_report_ >= config_.report_interval) {
        report();
    }
    return status;
}

void ConsumerSession::run(const std::atomic<bool>& running) {
    if (state_ != SessionState::Streaming) {
        return;
    }

    std::cout << "[consumer] Press 'q' to quit, 's' to toggle frame saving" << std::endl;

    while (running && !stop_requested_) {
        if (config_.max_messages > 0 && message_count_ >= config_.max_messages) {
            break;
        }
        if (step() == ReceiveStatus::Closed) {
            std::cerr << "[consumer] Transport closed, stopping" << std::endl;
            break;
        }
    }

    stop();
}

void ConsumerSession::report() {
    last_report_ = std::chrono::steady_clock::now();
    std::cout << "[consumer] FPS: " << std::fixed << std::setprecision(1) << metrics_.current_fps()
              << " Received=" << message_count_
              << " Timeouts=" << timeout_count_
              << " Corrupt=" << corrupt_count_
              << " Mismatch=" << mismatch_count_
              << " Saved=" << saved_count_ << std::endl;
}

void ConsumerSession::stop() {
    SessionState expected = SessionState::Streaming;
    if (!state_.compare_exchange_strong(expected, SessionState::Stopping)) {
        expected = SessionState::Idle;
        if (!state_.compare_exchange_strong(expected, SessionState::Stopping)) {
            return;
        }
    }

    std::string released;
    if (subscriber_ && subscriber_->is_connected()) {
        const std::string endpoint = subscriber_->endpoint();
        subscriber_->close();
        released += " subscriber(" + endpoint + ")";
    }
    if (sink_) {
        sink_->close();
        released += " sink";
    }

    state_ = SessionState::Closed;
    std::cout << "[consumer] Viewer closed. Messages=" << message_count_
              << " Released:" << (released.empty() ? " nothing" : released) << std::endl;
}

} // namespace framecast
