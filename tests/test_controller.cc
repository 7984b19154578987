#include "vrglove/controller/glove_controller.hpp"
#include "vrglove/calibration/calibration_store.hpp"
#include "mock_glove.hpp"
#include "test_common.hpp"

#include <atomic>
#include <cmath>
#include <filesystem>
#include <thread>
#include <unistd.h>

using namespace vrglove;

static ControllerOptions test_options(const std::string& root) {
    ControllerOptions o;
    o.log_directory = root + "/log";
    o.calibration_file = root + "/calibration.yml";
    o.transport = test::fast_transport_options();
    o.calibration.window = 20;
    o.calibration.min_samples = 10;
    o.calibration.timeout = std::chrono::milliseconds(3000);
    o.logger.retry_interval = std::chrono::milliseconds(20);
    return o;
}

static void test_parse_options() {
    ControllerOptions o;
    char prog[] = "vrglove_host";
    char dev[] = "/dev/ttyACM3";
    char logdir[] = "/data/log";
    char cal[] = "/data/cal.yml";
    char name[] = "DegapVrGlove-L";
    char help[] = "--help";

    char* full[] = {prog, dev, logdir, cal, name};
    VRGLOVE_CHECK(parse_options(5, full, o));
    VRGLOVE_CHECK(o.bridge_device == "/dev/ttyACM3");
    VRGLOVE_CHECK(o.log_directory == "/data/log");
    VRGLOVE_CHECK(o.calibration_file == "/data/cal.yml");
    VRGLOVE_CHECK(o.transport.name_filter == "DegapVrGlove-L");

    ControllerOptions d;
    char* none[] = {prog};
    VRGLOVE_CHECK(parse_options(1, none, d));
    VRGLOVE_CHECK(d.bridge_device == kDefaultBridgeDevice);
    VRGLOVE_CHECK(d.streams.size() == kSourceCount);

    char* asks_help[] = {prog, help};
    VRGLOVE_CHECK(!parse_options(2, asks_help, d));
}

static void test_session_lifecycle() {
    const std::string root = (std::filesystem::temp_directory_path() /
                              ("vrglove_controller_" + std::to_string(::getpid()))).string();
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    auto glove = std::make_shared<test::MockGlove>();
    glove->remove(CharId::force);   // older hardware without the pressure pad
    GloveController controller(glove, test_options(root));

    VRGLOVE_CHECK(controller.connect() == ErrorCode::ok);
    VRGLOVE_CHECK(controller.state() == SessionState::ready);
    VRGLOVE_CHECK(glove->notifying(CharId::imu1_raw));
    VRGLOVE_CHECK(glove->notifying(CharId::joystick));
    VRGLOVE_CHECK(glove->notifying(CharId::battery_level));
    VRGLOVE_CHECK(controller.registry()->device_info().firmware == "1.4.2");

    // Configuration flows through to calibration full scale.
    ConfigChange change;
    change.field = ConfigField::accel_range;
    change.value = 2.0f;
    SensorConfig applied;
    VRGLOVE_CHECK(controller.set_config(change, &applied) == ErrorCode::ok);
    VRGLOVE_CHECK(controller.config().imu[0].accel_range_g == 2.0f);
    VRGLOVE_CHECK(controller.calibrate_device_imu(3) == ErrorCode::invalid_argument);
    VRGLOVE_CHECK(controller.calibrate_device_imu(1) == ErrorCode::ok);

    // Record a short session.
    VRGLOVE_CHECK(controller.start_logging() == ErrorCode::ok);
    VRGLOVE_CHECK(controller.logging());
    VRGLOVE_CHECK(controller.start_logging() == ErrorCode::device_busy);

    const TimePoint t0 = Clock::now();
    for (int i = 0; i < 50; ++i) {
        glove->notify(CharId::imu1_raw, test::imu_payload(static_cast<std::int16_t>(i), 0, 1000),
                      t0 + std::chrono::milliseconds(i));
        glove->notify(CharId::joystick, test::joystick_payload(2048, 2048, 0),
                      t0 + std::chrono::milliseconds(i));
    }
    VRGLOVE_CHECK(test::wait_for([&] {
        return controller.router()->stats().per_source[static_cast<std::size_t>(SourceId::joystick)] == 50;
    }));
    const std::string imu_path = controller.stream_logger()->stream_path(SourceId::imu1);
    VRGLOVE_CHECK(controller.stop_logging() == ErrorCode::ok);
    VRGLOVE_CHECK(!controller.logging());

    LogHeader header;
    std::vector<SensorFrame> frames;
    VRGLOVE_CHECK(LogReader::read_all(imu_path, header, frames) == ErrorCode::ok);
    VRGLOVE_CHECK(frames.size() == 50);
    VRGLOVE_CHECK(header.address == glove->device().address);
    VRGLOVE_CHECK(header.firmware == "1.4.2");

    // Zero calibration while the glove rests, persisted per device.
    std::atomic<bool> resting{true};
    std::thread feeder([&] {
        while (resting.load()) {
            glove->notify(CharId::imu1_raw, test::imu_payload(15, -20, 990));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    CalibrationProfile profile;
    const ErrorCode zero_rc = controller.zero_calibrate(SourceId::imu1, &profile);
    resting = false;
    feeder.join();
    VRGLOVE_CHECK(zero_rc == ErrorCode::ok);
    VRGLOVE_CHECK(std::fabs(profile.offset[2] - 990.0f) < 1e-3f);

    CalibrationStore store(controller.options().calibration_file);
    std::vector<CalibrationProfile> saved;
    VRGLOVE_CHECK(store.load(glove->device().address, saved) == ErrorCode::ok);
    VRGLOVE_CHECK(saved.size() == 1 && saved[0].source == SourceId::imu1);

    VRGLOVE_CHECK(controller.import_calibration(SourceId::flex, {1, 1, 1, 1, 1}, {}) == ErrorCode::ok);
    VRGLOVE_CHECK(store.load(glove->device().address, saved) == ErrorCode::ok);
    VRGLOVE_CHECK(saved.size() == 2);

    controller.shutdown();
    VRGLOVE_CHECK(controller.state() == SessionState::idle);
    VRGLOVE_CHECK(!glove->is_connected());

    // A fresh controller picks the stored offsets up on connect.
    GloveController again(glove, test_options(root));
    VRGLOVE_CHECK(again.connect() == ErrorCode::ok);
    VRGLOVE_CHECK(again.calibration()->profile(SourceId::imu1, profile));
    again.shutdown();

    std::filesystem::remove_all(root);
}

static void test_manual_reconnect_resumes_streams() {
    const std::string root = (std::filesystem::temp_directory_path() /
                              ("vrglove_reconnect_" + std::to_string(::getpid()))).string();
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    auto glove = std::make_shared<test::MockGlove>();
    GloveController controller(glove, test_options(root));
    VRGLOVE_CHECK(controller.connect() == ErrorCode::ok);

    // Glove walks out of range until the reconnect budget is spent.
    glove->set_advertising(false);
    glove->drop_link();
    VRGLOVE_CHECK(test::wait_for([&] {
        return controller.registry()->last_error() == ErrorCode::connection_lost;
    }));
    VRGLOVE_CHECK(controller.state() == SessionState::idle);

    glove->set_advertising(true);
    VRGLOVE_CHECK(controller.reconnect() == ErrorCode::ok);
    VRGLOVE_CHECK(controller.state() == SessionState::ready);
    VRGLOVE_CHECK(glove->notifying(CharId::imu1_raw));
    VRGLOVE_CHECK(glove->notifying(CharId::imu2_raw));
    VRGLOVE_CHECK(glove->notifying(CharId::joystick));

    const std::size_t imu1 = static_cast<std::size_t>(SourceId::imu1);
    const std::uint64_t before = controller.router()->stats().per_source[imu1];
    VRGLOVE_CHECK(glove->notify(CharId::imu1_raw, test::imu_payload(1, 2, 3)));
    VRGLOVE_CHECK(test::wait_for([&] {
        return controller.router()->stats().per_source[imu1] == before + 1;
    }));

    // Same after a user disconnect.
    controller.disconnect();
    VRGLOVE_CHECK(!glove->notifying(CharId::imu1_raw));
    VRGLOVE_CHECK(controller.reconnect() == ErrorCode::ok);
    VRGLOVE_CHECK(glove->notifying(CharId::imu1_raw));

    controller.shutdown();
    std::filesystem::remove_all(root);
}

static void test_connect_failure() {
    auto glove = std::make_shared<test::MockGlove>();
    glove->set_advertising(false);
    ControllerOptions o = test_options("/tmp");
    GloveController controller(glove, o);
    VRGLOVE_CHECK(controller.connect() == ErrorCode::device_unreachable);
    VRGLOVE_CHECK(controller.state() == SessionState::idle);
}

int main() {
    VRGLOVE_LOG_INFO(test::logger()) << "=== glove controller ===";
    test_parse_options();
    test_session_lifecycle();
    test_manual_reconnect_resumes_streams();
    test_connect_failure();
    return test::report("test_controller");
}
