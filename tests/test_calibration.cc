#include "vrglove/calibration/calibration_engine.hpp"
#include "vrglove/calibration/calibration_store.hpp"
#include "test_common.hpp"

#include <atomic>
#include <cmath>
#include <cstdio>
#include <string>
#include <thread>
#include <unistd.h>

using namespace vrglove;

static SensorFrame imu_frame(float ax, float ay, float az) {
    SensorFrame f;
    f.source = SourceId::imu1;
    f.timestamp = Clock::now();
    f.raw = {ax, ay, az, 0.02f, -0.01f, 0.0f, 30.0f, -5.0f, 12.0f};
    f.values = f.raw;
    return f;
}

static CalibrationOptions quick_options() {
    CalibrationOptions o;
    o.window = 20;
    o.min_samples = 10;
    o.timeout = std::chrono::milliseconds(2000);
    o.drift_window = 40;
    o.drift_bound = 0.01f;
    return o;
}

// Feeds resting frames until the blocking capture returns.
static ErrorCode calibrate_while_streaming(CalibrationEngine& engine, CalibrationProfile& out) {
    std::atomic<bool> done{false};
    ErrorCode rc = ErrorCode::ok;
    std::thread worker([&] {
        rc = engine.zero_calibrate(SourceId::imu1, out);
        done = true;
    });
    while (!done.load()) {
        SensorFrame f = imu_frame(12.0f, -8.0f, 1003.0f);
        engine.apply(f);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    worker.join();
    return rc;
}

static void test_zero_calibration() {
    CalibrationEngine engine(quick_options());
    CalibrationProfile profile;
    VRGLOVE_CHECK(calibrate_while_streaming(engine, profile) == ErrorCode::ok);
    VRGLOVE_CHECK(profile.samples == 20);
    VRGLOVE_CHECK(profile.offset.size() == 9 && profile.scale.size() == 9);
    VRGLOVE_CHECK(std::fabs(profile.offset[2] - 1003.0f) < 1e-3f);
    VRGLOVE_CHECK(profile.calibrated_at_ms > 0);

    SensorFrame f = imu_frame(12.0f, -8.0f, 1003.0f);
    engine.apply(f);
    VRGLOVE_CHECK(f.calibrated);
    VRGLOVE_CHECK(std::fabs(f.values[0]) < 1e-3f && std::fabs(f.values[2]) < 1e-3f);
    VRGLOVE_CHECK(f.raw[2] == 1003.0f);

    // Non-calibratable sources are refused outright.
    VRGLOVE_CHECK(engine.zero_calibrate(SourceId::buttons, profile) == ErrorCode::invalid_argument);
}

static void test_insufficient_and_cancel() {
    CalibrationOptions o = quick_options();
    o.timeout = std::chrono::milliseconds(100);
    CalibrationEngine engine(o);
    CalibrationProfile profile;

    for (int i = 0; i < 3; ++i) {
        SensorFrame f = imu_frame(1.0f, 1.0f, 1000.0f);
        engine.apply(f);
    }
    VRGLOVE_CHECK(engine.zero_calibrate(SourceId::imu1, profile) == ErrorCode::insufficient_samples);
    VRGLOVE_CHECK(!engine.profile(SourceId::imu1, profile));

    o.timeout = std::chrono::milliseconds(5000);
    CalibrationEngine slow(o);
    ErrorCode rc = ErrorCode::ok;
    std::thread worker([&] { rc = slow.zero_calibrate(SourceId::imu1, profile); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    slow.cancel_capture();
    worker.join();
    VRGLOVE_CHECK(rc == ErrorCode::cancelled);
}

static void test_drift() {
    CalibrationOptions o = quick_options();
    o.drift_check_every = 0;
    CalibrationEngine engine(o);
    CalibrationProfile profile;
    VRGLOVE_CHECK(calibrate_while_streaming(engine, profile) == ErrorCode::ok);

    float drift = 0.0f;
    VRGLOVE_CHECK(engine.check_drift(SourceId::imu1, drift) == ErrorCode::insufficient_samples);

    int alerts = 0;
    engine.set_drift_listener([&alerts](SourceId, float) { ++alerts; });

    // 100 mg off at +-4 G full scale is 2.5 %.
    for (int i = 0; i < 40; ++i) {
        SensorFrame f = imu_frame(112.0f, -8.0f, 1003.0f);
        engine.apply(f);
    }
    VRGLOVE_CHECK(engine.check_drift(SourceId::imu1, drift) == ErrorCode::drift_exceeded);
    VRGLOVE_CHECK(std::fabs(drift - 0.025f) < 1e-3f);
    VRGLOVE_CHECK(alerts == 1);
    VRGLOVE_CHECK(engine.profile(SourceId::imu1, profile) && std::fabs(profile.drift - 0.025f) < 1e-3f);

    // A wider range halves the same error.
    SensorConfig cfg;
    cfg.imu[0].accel_range_g = 8.0f;
    engine.set_sensor_config(cfg);
    VRGLOVE_CHECK(engine.check_drift(SourceId::imu1, drift) == ErrorCode::drift_exceeded);
    VRGLOVE_CHECK(std::fabs(drift - 0.0125f) < 1e-3f);

    for (int i = 0; i < 40; ++i) {
        SensorFrame f = imu_frame(12.0f, -8.0f, 1003.0f);
        engine.apply(f);
    }
    VRGLOVE_CHECK(engine.check_drift(SourceId::imu1, drift) == ErrorCode::ok);
    VRGLOVE_CHECK(drift < 1e-4f);
}

static void test_drift_checked_while_streaming() {
    CalibrationOptions o = quick_options();
    o.drift_check_every = 10;
    CalibrationEngine engine(o);
    CalibrationProfile profile;
    VRGLOVE_CHECK(calibrate_while_streaming(engine, profile) == ErrorCode::ok);

    std::atomic<int> alerts{0};
    std::atomic<float> last{0.0f};
    engine.set_drift_listener([&](SourceId source, float drift) {
        VRGLOVE_CHECK(source == SourceId::imu1);
        last = drift;
        ++alerts;
    });

    for (int i = 0; i < 40; ++i) {
        SensorFrame f = imu_frame(112.0f, -8.0f, 1003.0f);
        engine.apply(f);
    }
    VRGLOVE_CHECK(alerts == 1);
    VRGLOVE_CHECK(last > o.drift_bound);
    VRGLOVE_CHECK(engine.profile(SourceId::imu1, profile) && std::fabs(profile.drift - 0.025f) < 1e-3f);

    // Back at rest the alert re-arms; the next excursion is reported again.
    for (int i = 0; i < 40; ++i) {
        SensorFrame f = imu_frame(12.0f, -8.0f, 1003.0f);
        engine.apply(f);
    }
    VRGLOVE_CHECK(alerts == 1);
    VRGLOVE_CHECK(engine.profile(SourceId::imu1, profile) && profile.drift < 1e-4f);

    for (int i = 0; i < 40; ++i) {
        SensorFrame f = imu_frame(112.0f, -8.0f, 1003.0f);
        engine.apply(f);
    }
    VRGLOVE_CHECK(alerts == 2);

    // Uncalibrated streams are never checked.
    engine.clear(SourceId::imu1);
    for (int i = 0; i < 40; ++i) {
        SensorFrame f = imu_frame(112.0f, -8.0f, 1003.0f);
        engine.apply(f);
    }
    VRGLOVE_CHECK(alerts == 2);
}

static void test_import_and_joystick() {
    CalibrationEngine engine;
    VRGLOVE_CHECK(engine.import_offsets(SourceId::joystick, {1.0f, 2.0f}, {}) == ErrorCode::invalid_argument);

    // Stick rests at (2100, 1990): learned center shifts the deflection.
    VRGLOVE_CHECK(engine.import_offsets(SourceId::joystick, {2100.0f, 1990.0f, 0.0f, 0.0f, 0.0f}, {}) == ErrorCode::ok);
    SensorFrame f;
    f.source = SourceId::joystick;
    f.raw = {2100.0f, 1990.0f, 0.0f, 0.0f, 0.0f};
    f.values = f.raw;
    engine.apply(f);
    VRGLOVE_CHECK(f.calibrated);
    VRGLOVE_CHECK(f.values[0] == 0.0f && f.values[1] == 0.0f);
    VRGLOVE_CHECK(f.values[2] == 0.0f && f.values[3] == 0.0f);

    f.raw = {4095.0f, 1990.0f, 100.0f, 0.0f, 1.0f};
    f.values = f.raw;
    engine.apply(f);
    VRGLOVE_CHECK(f.values[2] > 90.0f);
    VRGLOVE_CHECK(f.values[4] == 1.0f);

    engine.clear(SourceId::joystick);
    CalibrationProfile p;
    VRGLOVE_CHECK(!engine.profile(SourceId::joystick, p));
}

static void test_store() {
    const std::string path = "/tmp/vrglove_calibration_" + std::to_string(::getpid()) + ".yml";
    std::remove(path.c_str());

    CalibrationStore store(path);
    std::vector<CalibrationProfile> loaded;
    VRGLOVE_CHECK(store.load("D4:36:39:8A:11:02", loaded) == ErrorCode::ok);
    VRGLOVE_CHECK(loaded.empty());

    CalibrationProfile imu;
    imu.source = SourceId::imu1;
    imu.offset = {12.0f, -8.0f, 1003.0f, 0.02f, -0.01f, 0.0f, 30.0f, -5.0f, 12.0f};
    imu.scale.assign(9, 1.0f);
    imu.scale[2] = 0.98f;
    imu.drift = 0.004f;
    imu.calibrated_at_ms = 1760000000123LL;
    imu.samples = 100;

    CalibrationProfile flex;
    flex.source = SourceId::flex;
    flex.offset = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    flex.scale.assign(5, 1.0f);

    VRGLOVE_CHECK(store.save("D4:36:39:8A:11:02", {imu, flex}) == ErrorCode::ok);
    VRGLOVE_CHECK(store.save("AA:BB:CC:DD:EE:FF", {flex}) == ErrorCode::ok);

    VRGLOVE_CHECK(store.load("D4:36:39:8A:11:02", loaded) == ErrorCode::ok);
    VRGLOVE_CHECK(loaded.size() == 2);
    for (const CalibrationProfile& p : loaded) {
        if (p.source == SourceId::imu1) {
            VRGLOVE_CHECK(p.offset == imu.offset);
            VRGLOVE_CHECK(std::fabs(p.scale[2] - 0.98f) < 1e-6f);
            VRGLOVE_CHECK(p.calibrated_at_ms == imu.calibrated_at_ms);
            VRGLOVE_CHECK(p.samples == 100);
        } else {
            VRGLOVE_CHECK(p.source == SourceId::flex);
        }
    }

    VRGLOVE_CHECK(store.load("AA:BB:CC:DD:EE:FF", loaded) == ErrorCode::ok);
    VRGLOVE_CHECK(loaded.size() == 1);
    VRGLOVE_CHECK(store.load("00:00:00:00:00:00", loaded) == ErrorCode::ok);
    VRGLOVE_CHECK(loaded.empty());

    VRGLOVE_CHECK(CalibrationStore::device_key("D4:36:39:8A:11:02") == "dev_D4_36_39_8A_11_02");
    std::remove(path.c_str());
}

int main() {
    VRGLOVE_LOG_INFO(test::logger()) << "=== calibration ===";
    test_zero_calibration();
    test_insufficient_and_cancel();
    test_drift();
    test_drift_checked_while_streaming();
    test_import_and_joystick();
    test_store();
    return test::report("test_calibration");
}
