#pragma once

#include "frame_codec.hpp"
#include "frame_publisher.hpp"
#include "frame_sink.hpp"
#include "frame_source.hpp"
#include "frame_subscriber.hpp"
#include "keyboard_input.hpp"
#include "metrics_tracker.hpp"
#include "stream_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace framecast {

enum class SessionState {
    Idle,
    Streaming,
    Stopping,
    Closed,
};

const char* to_string(SessionState state);

// Capture -> encode -> publish loop. Owns the device and the transport and
// releases both exactly once when it stops.
class ProducerSession {
public:
    struct Config {
        std::string stream_id = "ego_view";
        double duration_s = 0.0;  // 0 = run until stopped
        uint64_t max_frames = 0;  // 0 = unlimited
        int grab_timeout_ms = 1000;
        std::chrono::milliseconds report_interval{2000};
    };

    ProducerSession(const Config& config,
                    const StreamEndpointConfig& endpoint,
                    std::unique_ptr<FrameSource> source,
                    std::unique_ptr<FramePublisher> publisher,
                    const FrameCodec& codec);
    ~ProducerSession();

    ProducerSession(const ProducerSession&) = delete;
    ProducerSession& operator=(const ProducerSession&) = delete;

    // Local preview, recorder, ... Must be added before start().
    void add_sink(std::unique_ptr<FrameSink> sink);

    // Idle -> Streaming. Opening the device is the only fatal step; on failure
    // the session goes straight to Closed.
    bool start();

    // Loops until `running` drops, request_stop(), the duration or frame cap is
    // reached, or the device fails. Always ends in Closed.
    void run(const std::atomic<bool>& running);

    void request_stop() { stop_requested_ = true; }

    // Streaming -> Stopping -> Closed. Idempotent.
    void stop();

    SessionState state() const { return state_; }
    const MetricsTracker& metrics() const { return metrics_; }
    const FramePublisher* publisher() const { return publisher_.get(); }

    uint64_t get_frame_count() const { return frame_count_; }
    uint64_t get_missed_count() const { return missed_count_; }
    uint64_t get_encode_failures() const { return encode_failures_; }

private:
    bool should_continue(const std::atomic<bool>& running) const;
    void report();

    Config config_;
    StreamEndpointConfig endpoint_;
    std::unique_ptr<FrameSource> source_;
    std::unique_ptr<FramePublisher> publisher_;
    FrameCodec codec_;
    std::vector<std::unique_ptr<FrameSink>> sinks_;
    MetricsTracker metrics_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> stop_requested_{false};

    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point last_report_;
    uint64_t frame_count_ = 0;
    uint64_t missed_count_ = 0;
    uint64_t encode_failures_ = 0;
};

// Receive -> decode -> measure -> render loop.
class ConsumerSession {
public:
    struct Config {
        std::chrono::milliseconds receive_timeout{5000};
        bool save_enabled = false;
        std::string save_dir = "./captured_frames";
        int jpeg_quality = 90;
        std::chrono::milliseconds report_interval{2000};
        uint64_t max_messages = 0;  // 0 = unlimited
    };

    ConsumerSession(const Config& config,
                    std::unique_ptr<FrameSubscriber> subscriber,
                    const FrameCodec& codec,
                    std::unique_ptr<FrameSink> sink);
    ~ConsumerSession();

    ConsumerSession(const ConsumerSession&) = delete;
    ConsumerSession& operator=(const ConsumerSession&) = delete;

    // Optional; polled once per iteration. Not owned.
    void set_keyboard(KeyboardInput* keyboard) { keyboard_ = keyboard; }

    bool start();
    void run(const std::atomic<bool>& running);

    // One receive iteration. Returns the receive outcome.
    ReceiveStatus step();

    // 's' toggles saving, 'q' / ESC asks the loop to quit.
    void handle_key(int key);
    bool enable_save(const std::string& dir);
    void disable_save() { saving_ = false; }
    bool is_saving() const { return saving_; }

    void request_stop() { stop_requested_ = true; }
    void stop();

    SessionState state() const { return state_; }
    const MetricsTracker& metrics() const { return metrics_; }

    // Last measured latency for a stream; false if none seen yet.
    bool last_latency(const std::string& stream_id, std::chrono::microseconds& out) const;

    uint64_t get_message_count() const { return message_count_; }
    uint64_t get_frame_count() const { return frame_count_; }
    uint64_t get_timeout_count() const { return timeout_count_; }
    uint64_t get_corrupt_count() const { return corrupt_count_; }
    uint64_t get_mismatch_count() const { return mismatch_count_; }
    uint64_t get_saved_count() const { return saved_count_; }

private:
    void handle_message(const EncodedMessage& message);
    bool check_geometry(const std::string& stream_id, const Frame& frame);
    void report();

    Config config_;
    std::unique_ptr<FrameSubscriber> subscriber_;
    FrameCodec codec_;
    std::unique_ptr<FrameSink> sink_;
    KeyboardInput* keyboard_ = nullptr;
    MetricsTracker metrics_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> stop_requested_{false};

    bool saving_ = false;
    std::string save_dir_;

    // Geometry is fixed per stream for the session, locked on first frame
    std::map<std::string, std::pair<int, int>> geometry_;
    std::map<std::string, std::chrono::microseconds> last_latency_;

    std::chrono::steady_clock::time_point last_report_;
    uint64_t message_count_ = 0;
    uint64_t frame_count_ = 0;
    uint64_t timeout_count_ = 0;
    uint64_t corrupt_count_ = 0;
    uint64_t mismatch_count_ = 0;
    uint64_t saved_count_ = 0;
};

} // namespace framecast
