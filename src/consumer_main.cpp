#include "cli_options.hpp"
#include "frame_codec.hpp"
#include "frame_sink.hpp"
#include "frame_subscriber.hpp"
#include "keyboard_input.hpp"
#include "stream_session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    framecast::ConsumerOptions options;
    std::string error;
    if (!framecast::parse_consumer_args(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n";
        framecast::print_consumer_usage(std::cerr, argv[0]);
        return 2;
    }
    if (options.show_help) {
        framecast::print_consumer_usage(std::cout, argv[0]);
        return 0;
    }

    framecast::FrameSubscriber::Config subscriber_config;
    subscriber_config.endpoint = framecast::connect_endpoint(options.ip, options.port);

    std::unique_ptr<framecast::FrameSubscriber> subscriber;
    try {
        subscriber = std::make_unique<framecast::FrameSubscriber>(subscriber_config);
    } catch (const zmq::error_t& e) {
        std::cerr << "Failed to connect " << subscriber_config.endpoint << ": " << e.what() << std::endl;
        return 1;
    }

    framecast::ConsumerSession::Config session_config;
    session_config.receive_timeout = std::chrono::milliseconds(options.timeout_ms);
    session_config.save_enabled = options.save;
    session_config.save_dir = options.save_dir;

    framecast::ConsumerSession session(session_config,
                                       std::move(subscriber),
                                       framecast::FrameCodec(),
                                       std::make_unique<framecast::ConsoleSink>());

    std::unique_ptr<framecast::KeyboardInput> keyboard;
    if (options.keyboard) {
        keyboard = std::make_unique<framecast::KeyboardInput>();
        session.set_keyboard(keyboard.get());
    }

    if (!session.start()) {
        return 1;
    }

    session.run(running);
    return 0;
}
