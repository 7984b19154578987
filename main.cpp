#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>
#include "./vrglove/controller/glove_controller.hpp"
#include "./vrglove/link/bridge_link.h"
#include "./vrglove/worker/workers.hpp"
#include "./vrglove/log.h"

static std::atomic<bool> g_stop_flag{false};

void signal_handler(int) {
    g_stop_flag.store(true, std::memory_order_relaxed);
}

static void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [bridge_device] [log_directory] [calibration_file] [device_name|address]\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT,  signal_handler);
    std::signal(SIGTERM, signal_handler);
    vrglove::Logger::ptr logger = VRGLOVE_LOG_ROOT();

    vrglove::ControllerOptions options;
    if (!vrglove::parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }

    auto link = std::make_shared<vrglove::BridgeLink>(options.bridge_device);
    if (!link->open()) {
        VRGLOVE_LOG_FATAL(logger) << "cannot open bridge " << options.bridge_device;
        return 1;
    }

    vrglove::GloveController controller(link, options);

    vrglove::ErrorCode rc = controller.connect();
    if (rc != vrglove::ErrorCode::ok) {
        VRGLOVE_LOG_FATAL(logger) << "connect failed: " << vrglove::to_string(rc);
        controller.shutdown();
        link->close();
        return 1;
    }

    rc = controller.start_logging();
    if (rc != vrglove::ErrorCode::ok) {
        // streaming still useful without a recording
        VRGLOVE_LOG_ERROR(logger) << "recording disabled: " << vrglove::to_string(rc);
    } else {
        VRGLOVE_LOG_INFO(logger) << "recording to " << controller.stream_logger()->session_directory();
    }

    auto display_sub = controller.router()->subscribe("display", options.subscriber_capacity);
    vrglove::DisplayWorker display(display_sub, controller.session(), controller.router(),
                                   controller.stream_logger(), g_stop_flag);
    std::thread display_thread(std::ref(display));

    while (!g_stop_flag.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (display_thread.joinable()) display_thread.join();
    controller.router()->unsubscribe(display_sub);
    controller.shutdown();
    link->close();
    return 0;
}
