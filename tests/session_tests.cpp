#include <frame_sink.hpp>
#include <frame_source.hpp>
#include <pattern_source.hpp>
#include <stream_session.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    using namespace std::chrono;

    struct SourceStats {
        int opens = 0;
        int releases = 0;
        int grabs = 0;
    };

    // Small in-memory device. Optionally misses every other grab, misses one
    // grab, or fails fatally after a number of frames.
    class FakeSource : public framecast::FrameSource {
    public:
        explicit FakeSource(SourceStats& stats, bool open_ok = true)
            : stats_(stats), open_ok_(open_ok) {}
        ~FakeSource() override { close(); }

        const char* name() const override { return "fake"; }

        bool miss_every_other = false;
        int miss_once_at = -1;
        int fatal_after = -1;

    protected:
        bool do_open(const framecast::StreamEndpointConfig&) override {
            stats_.opens++;
            return open_ok_;
        }

        framecast::GrabStatus do_grab(framecast::Frame& out, int) override {
            const int n = stats_.grabs++;
            if (fatal_after >= 0 && n >= fatal_after) {
                return framecast::GrabStatus::Fatal;
            }
            if ((miss_every_other && n % 2 == 1) || n == miss_once_at) {
                return framecast::GrabStatus::Miss;
            }
            out.captured_at = framecast::now_timestamp();
            out.image.width = 16;
            out.image.height = 12;
            out.image.channels = 3;
            out.image.data.assign(out.image.expected_size(), static_cast<uint8_t>(n));
            return framecast::GrabStatus::Ok;
        }

        void do_release() override { stats_.releases++; }

    private:
        SourceStats& stats_;
        bool open_ok_;
    };

    class CountingSink : public framecast::FrameSink {
    public:
        explicit CountingSink(int& renders, int& closes) : renders_(renders), closes_(closes) {}

        void render(const framecast::Frame&, const framecast::RenderInfo&) override { renders_++; }
        bool persist(const framecast::Frame& frame, const std::string& path) override {
            return framecast::write_frame_files(frame, path, 80);
        }
        void close() override { closes_++; }

    private:
        int& renders_;
        int& closes_;
    };

    std::string temp_dir(const std::string& prefix) {
        namespace fs = std::filesystem;
        const auto stamp = steady_clock::now().time_since_epoch().count();
        return (fs::temp_directory_path() / (prefix + "_" + std::to_string(stamp))).string();
    }

    std::unique_ptr<framecast::FramePublisher> local_publisher() {
        framecast::FramePublisher::Config cfg;
        cfg.endpoint = "tcp://127.0.0.1:*";
        return std::make_unique<framecast::FramePublisher>(cfg);
    }

    std::unique_ptr<framecast::FramePublisher> unbound_publisher() {
        framecast::FramePublisher::Config cfg;
        cfg.endpoint.clear();
        return std::make_unique<framecast::FramePublisher>(cfg);
    }

    void test_open_failure_is_fatal() {
        SourceStats stats;
        framecast::ProducerSession session(framecast::ProducerSession::Config(),
                                           framecast::StreamEndpointConfig(),
                                           std::make_unique<FakeSource>(stats, false),
                                           unbound_publisher(),
                                           framecast::FrameCodec());

        check(!session.start(), "start should fail when the device cannot be opened");
        check(session.state() == framecast::SessionState::Closed, "failed start should end in Closed");
        check(!session.start(), "Closed is terminal");
        check(stats.releases == 0, "a device that never opened should not be released");
    }

    void test_stop_releases_once() {
        SourceStats stats;
        int renders = 0;
        int closes = 0;

        framecast::ProducerSession::Config cfg;
        cfg.max_frames = 5;
        auto source = std::make_unique<FakeSource>(stats);
        FakeSource* raw_source = source.get();

        framecast::ProducerSession session(cfg, framecast::StreamEndpointConfig(),
                                           std::move(source), local_publisher(),
                                           framecast::FrameCodec());
        session.add_sink(std::make_unique<CountingSink>(renders, closes));

        check(session.start(), "start should succeed");
        check(session.state() == framecast::SessionState::Streaming, "start should enter Streaming");

        std::atomic<bool> running{true};
        session.run(running);

        check(session.state() == framecast::SessionState::Closed, "run should end in Closed");
        check(session.get_frame_count() == 5, "frame cap should stop the loop");
        check(renders == 5, "every captured frame should reach the sinks");
        check(session.publisher()->get_published_count() == 5, "every frame should be published");

        session.stop();
        session.stop();
        raw_source->close();
        check(stats.opens == 1, "device should be opened once");
        check(stats.releases == 1, "device should be released exactly once");
        check(closes == 1, "sinks should be closed exactly once");
        check(!session.publisher()->is_bound(), "transport binding should be released");
    }

    void test_interrupt_is_polled_each_iteration() {
        SourceStats stats;
        framecast::ProducerSession session(framecast::ProducerSession::Config(),
                                           framecast::StreamEndpointConfig(),
                                           std::make_unique<FakeSource>(stats),
                                           unbound_publisher(),
                                           framecast::FrameCodec());
        check(session.start(), "start should succeed");

        std::atomic<bool> running{false};
        session.run(running);
        check(stats.grabs == 0, "a pending interrupt should stop the loop before grabbing");
        check(stats.releases == 1, "interrupt should still release the device");
    }

    void test_missed_frames_are_not_fatal() {
        SourceStats stats;
        framecast::ProducerSession::Config cfg;
        cfg.max_frames = 5;
        auto source = std::make_unique<FakeSource>(stats);
        source->miss_every_other = true;

        framecast::ProducerSession session(cfg, framecast::StreamEndpointConfig(),
                                           std::move(source), unbound_publisher(),
                                           framecast::FrameCodec());
        check(session.start(), "start should succeed");
        std::atomic<bool> running{true};
        session.run(running);

        check(session.get_frame_count() == 5, "loop should continue past missed frames");
        check(session.get_missed_count() == 4, "misses should be counted");
        check(session.publisher()->get_dropped_count() == 5,
              "unbound publisher should count every frame as dropped");
    }

    void test_single_capture_error_keeps_streaming() {
        SourceStats stats;
        framecast::ProducerSession::Config cfg;
        cfg.max_frames = 6;
        auto source = std::make_unique<FakeSource>(stats);
        source->miss_once_at = 2;

        framecast::ProducerSession session(cfg, framecast::StreamEndpointConfig(),
                                           std::move(source), unbound_publisher(),
                                           framecast::FrameCodec());
        check(session.start(), "start should succeed");
        std::atomic<bool> running{true};
        session.run(running);

        check(session.get_frame_count() == 6, "streaming should continue after one failed grab");
        check(session.get_missed_count() == 1, "the failed grab should be counted once");
        check(stats.grabs == 7, "the loop should grab again right after the failure");
        check(stats.releases == 1, "device should be released once at the end");
    }

    void test_duration_limit_stops_loop() {
        framecast::StreamEndpointConfig endpoint_cfg;
        endpoint_cfg.resolution = framecast::ResolutionClass::VGA;
        endpoint_cfg.fps = 30;

        framecast::ProducerSession::Config cfg;
        cfg.duration_s = 0.3;
        cfg.max_frames = 0;

        framecast::ProducerSession session(cfg, endpoint_cfg,
                                           std::make_unique<framecast::PatternSource>(),
                                           unbound_publisher(), framecast::FrameCodec());
        check(session.start(), "start should succeed");

        std::atomic<bool> running{true};
        const auto start = steady_clock::now();
        session.run(running);
        const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();

        check(session.state() == framecast::SessionState::Closed, "duration limit should end in Closed");
        check(elapsed >= 250 && elapsed < 2000, "run should last about the configured duration, took " +
              std::to_string(elapsed) + "ms");
        check(session.get_frame_count() >= 3 && session.get_frame_count() <= 15,
              "about 0.3s worth of frames at 30 fps, got " + std::to_string(session.get_frame_count()));
    }

    void test_fatal_device_error_stops_loop() {
        SourceStats stats;
        auto source = std::make_unique<FakeSource>(stats);
        source->fatal_after = 3;

        framecast::ProducerSession session(framecast::ProducerSession::Config(),
                                           framecast::StreamEndpointConfig(),
                                           std::move(source), unbound_publisher(),
                                           framecast::FrameCodec());
        check(session.start(), "start should succeed");
        std::atomic<bool> running{true};
        session.run(running);

        check(session.get_frame_count() == 3, "frames before the failure should be processed");
        check(session.state() == framecast::SessionState::Closed, "fatal error should close the session");
        check(stats.releases == 1, "fatal error should release the device once");
    }

    void test_producer_to_consumer_scenario() {
        // 30 fps, no depth, 10 frames; consumer waits up to 5s per receive
        auto publisher = local_publisher();
        const std::string endpoint = publisher->endpoint();

        framecast::FrameSubscriber::Config sub_cfg;
        sub_cfg.endpoint = endpoint;

        framecast::ConsumerSession::Config consumer_cfg;
        consumer_cfg.receive_timeout = milliseconds(5000);
        consumer_cfg.save_enabled = true;
        consumer_cfg.save_dir = temp_dir("framecast_saved");

        int renders = 0;
        int closes = 0;
        framecast::ConsumerSession consumer(consumer_cfg,
                                            std::make_unique<framecast::FrameSubscriber>(sub_cfg),
                                            framecast::FrameCodec(),
                                            std::make_unique<CountingSink>(renders, closes));
        check(consumer.start(), "consumer should start");
        std::this_thread::sleep_for(milliseconds(300));

        framecast::StreamEndpointConfig endpoint_cfg;
        endpoint_cfg.resolution = framecast::ResolutionClass::VGA;
        endpoint_cfg.fps = 30;
        endpoint_cfg.enable_depth = false;

        framecast::ProducerSession::Config producer_cfg;
        producer_cfg.max_frames = 10;

        framecast::ProducerSession producer(producer_cfg, endpoint_cfg,
                                            std::make_unique<framecast::PatternSource>(),
                                            std::move(publisher), framecast::FrameCodec());
        check(producer.start(), "producer should start");

        std::atomic<bool> running{true};
        std::thread producer_thread([&] { producer.run(running); });

        const framecast::ReceiveStatus first = consumer.step();
        check(first == framecast::ReceiveStatus::Ok, "consumer should receive at least one frame");

        producer_thread.join();

        // Drain whatever is still pending; the next timeout ends the run
        for (int i = 0; i < 11; ++i) {
            if (consumer.step() != framecast::ReceiveStatus::Ok) break;
        }

        const uint64_t received = consumer.get_message_count();
        check(received >= 1 && received <= 10, "consumer should see between 1 and 10 messages, saw " +
              std::to_string(received));
        check(consumer.get_corrupt_count() == 0 && consumer.get_mismatch_count() == 0,
              "success path should not report errors");
        check(renders == static_cast<int>(received), "every received frame should be rendered");

        std::chrono::microseconds latency(-1);
        check(consumer.last_latency("ego_view", latency) && latency.count() >= 0,
              "same-host latency should be measured and non-negative");

        check(consumer.get_saved_count() == received, "every frame should be saved while saving is on");
        check(std::filesystem::exists(consumer_cfg.save_dir + "/ego_view_000000.jpg"),
              "first frame should be saved with the stream name and index");

        consumer.stop();
        check(closes == 1, "consumer sink should be closed once");
        std::filesystem::remove_all(consumer_cfg.save_dir);
    }

    void test_depth_travels_to_saved_files() {
        auto publisher = local_publisher();
        framecast::FrameSubscriber::Config sub_cfg;
        sub_cfg.endpoint = publisher->endpoint();

        framecast::ConsumerSession::Config consumer_cfg;
        consumer_cfg.receive_timeout = milliseconds(5000);
        consumer_cfg.save_enabled = true;
        consumer_cfg.save_dir = temp_dir("framecast_depth");

        int renders = 0;
        int closes = 0;
        framecast::ConsumerSession consumer(consumer_cfg,
                                            std::make_unique<framecast::FrameSubscriber>(sub_cfg),
                                            framecast::FrameCodec(),
                                            std::make_unique<CountingSink>(renders, closes));
        check(consumer.start(), "consumer should start");
        std::this_thread::sleep_for(milliseconds(300));

        framecast::StreamEndpointConfig endpoint_cfg;
        endpoint_cfg.resolution = framecast::ResolutionClass::VGA;
        endpoint_cfg.fps = 30;
        endpoint_cfg.enable_depth = true;

        framecast::ProducerSession::Config producer_cfg;
        producer_cfg.max_frames = 10;

        framecast::ProducerSession producer(producer_cfg, endpoint_cfg,
                                            std::make_unique<framecast::PatternSource>(),
                                            std::move(publisher), framecast::FrameCodec());
        check(producer.start(), "producer should start");

        std::atomic<bool> running{true};
        std::thread producer_thread([&] { producer.run(running); });
        check(consumer.step() == framecast::ReceiveStatus::Ok, "consumer should receive a depth frame");
        producer_thread.join();

        check(consumer.get_mismatch_count() == 0, "aligned depth should not be flagged");
        check(std::filesystem::exists(consumer_cfg.save_dir + "/ego_view_000000.jpg"),
              "image should be saved");
        check(std::filesystem::exists(consumer_cfg.save_dir + "/ego_view_000000_depth.pgm"),
              "depth should be saved next to the image");

        consumer.stop();
        std::filesystem::remove_all(consumer_cfg.save_dir);
    }

    void test_consumer_keys_toggle_save_and_quit() {
        framecast::FrameSubscriber::Config sub_cfg;
        sub_cfg.endpoint = "ipc:///tmp/framecast_test_keys";

        framecast::ConsumerSession::Config cfg;
        cfg.save_dir = temp_dir("framecast_keys");
        cfg.receive_timeout = milliseconds(50);

        framecast::ConsumerSession consumer(cfg,
                                            std::make_unique<framecast::FrameSubscriber>(sub_cfg),
                                            framecast::FrameCodec(),
                                            std::make_unique<framecast::ConsoleSink>());
        check(consumer.start(), "consumer should start");
        check(!consumer.is_saving(), "saving should be off by default");

        consumer.handle_key('s');
        check(consumer.is_saving(), "'s' should turn saving on");
        check(std::filesystem::is_directory(cfg.save_dir), "turning saving on should create the directory");
        consumer.handle_key('s');
        check(!consumer.is_saving(), "'s' again should turn saving off");

        check(consumer.step() == framecast::ReceiveStatus::Timeout, "no producer should mean a timeout");
        check(consumer.get_timeout_count() == 1, "timeouts should be counted");

        consumer.handle_key('q');
        std::atomic<bool> running{true};
        const auto start = steady_clock::now();
        consumer.run(running);
        check(steady_clock::now() - start < milliseconds(500), "'q' should end the loop promptly");
        check(consumer.state() == framecast::SessionState::Closed, "quit should close the session");
        check(consumer.step() == framecast::ReceiveStatus::Closed, "no operation is valid after Closed");

        std::filesystem::remove_all(cfg.save_dir);
    }

    void test_consumer_drops_geometry_changes() {
        auto publisher = local_publisher();
        framecast::FrameSubscriber::Config sub_cfg;
        sub_cfg.endpoint = publisher->endpoint();

        framecast::ConsumerSession::Config cfg;
        cfg.receive_timeout = milliseconds(100);
        int renders = 0;
        int closes = 0;
        framecast::ConsumerSession consumer(cfg,
                                            std::make_unique<framecast::FrameSubscriber>(sub_cfg),
                                            framecast::FrameCodec(),
                                            std::make_unique<CountingSink>(renders, closes));
        check(consumer.start(), "consumer should start");

        framecast::FrameCodec::Config raw_cfg;
        raw_cfg.encoding = framecast::ImageEncoding::Raw;
        framecast::FrameCodec codec(raw_cfg);

        auto make = [&](int w, int h) {
            framecast::Frame f;
            f.captured_at = framecast::now_timestamp();
            f.image.width = w;
            f.image.height = h;
            f.image.channels = 3;
            f.image.data.assign(f.image.expected_size(), 7);
            framecast::EncodedMessage m;
            m.streams.resize(1);
            codec.encode(f, "head", m.streams[0]);
            return m;
        };

        bool first_seen = false;
        for (int i = 0; i < 50 && !first_seen; ++i) {
            publisher->publish(make(16, 12));
            first_seen = consumer.step() == framecast::ReceiveStatus::Ok;
        }
        check(first_seen, "first frame should arrive");

        bool resized_seen = false;
        for (int i = 0; i < 20 && !resized_seen; ++i) {
            publisher->publish(make(8, 6));
            resized_seen = consumer.step() == framecast::ReceiveStatus::Ok;
        }
        check(resized_seen, "resized frame should arrive");
        check(consumer.get_mismatch_count() >= 1, "frames that change geometry mid-session should be dropped");
        check(renders == 1, "only the frame matching the session geometry should be rendered");
    }
}

int main() {
    test_open_failure_is_fatal();
    test_stop_releases_once();
    test_interrupt_is_polled_each_iteration();
    test_missed_frames_are_not_fatal();
    test_single_capture_error_keeps_streaming();
    test_duration_limit_stops_loop();
    test_fatal_device_error_stops_loop();
    test_producer_to_consumer_scenario();
    test_depth_travels_to_saved_files();
    test_consumer_keys_toggle_save_and_quit();
    test_consumer_drops_geometry_changes();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all session tests passed\n";
    return 0;
}
