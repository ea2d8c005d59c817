#include "cli_options.hpp"
#include "frame_publisher.hpp"
#include "frame_sink.hpp"
#include "frame_source.hpp"
#include "stream_session.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Parse arguments
    framecast::ProducerOptions options;
    std::string error;
    if (!framecast::parse_producer_args(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n";
        framecast::print_producer_usage(std::cerr, argv[0]);
        return 2;
    }
    if (options.show_help) {
        framecast::print_producer_usage(std::cout, argv[0]);
        return 0;
    }

    // Port 0 leaves the publisher unbound
    framecast::FramePublisher::Config publisher_config;
    publisher_config.high_water_mark = options.high_water_mark;
    publisher_config.endpoint = options.endpoint.port > 0
        ? framecast::bind_endpoint(options.endpoint.host, options.endpoint.port)
        : std::string();

    std::unique_ptr<framecast::FramePublisher> publisher;
    try {
        publisher = std::make_unique<framecast::FramePublisher>(publisher_config);
    } catch (const zmq::error_t& e) {
        std::cerr << "Failed to bind " << publisher_config.endpoint << ": " << e.what() << std::endl;
        return 1;
    }

    framecast::ProducerSession::Config session_config;
    session_config.stream_id = options.stream_name;
    session_config.duration_s = options.duration_s;
    session_config.max_frames = options.max_frames;
    session_config.grab_timeout_ms = 1000;

    framecast::ProducerSession session(session_config,
                                       options.endpoint,
                                       framecast::make_frame_source(options.source),
                                       std::move(publisher),
                                       framecast::FrameCodec(options.codec));

    if (options.display) {
        session.add_sink(std::make_unique<framecast::ConsoleSink>());
    }
    if (!options.save_path.empty()) {
        auto recorder = std::make_unique<framecast::MjpegFileSink>(options.save_path,
                                                                options.codec.jpeg_quality);
        if (!recorder->is_open()) {
            return 1;
        }
        session.add_sink(std::move(recorder));
    }

    // Start capture
    if (!session.start()) {
        std::cerr << "Failed to start frame source" << std::endl;
        return 1;
    }

    // Main loop: capture and publish frames
    session.run(running);

    std::cout << "Shutdown complete" << std::endl;
    return 0;
}
