#include "vrglove/registry/config_registry.hpp"
#include "vrglove/codec/characteristic_codec.hpp"
#include "mock_glove.hpp"
#include "test_common.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

using namespace vrglove;

namespace {

struct Rig {
    std::shared_ptr<test::MockGlove>  glove = std::make_shared<test::MockGlove>();
    std::shared_ptr<TransportSession> session;
    std::shared_ptr<ConfigRegistry>   registry;

    Rig() {
        session = std::make_shared<TransportSession>(glove, test::fast_transport_options());
        registry = std::make_shared<ConfigRegistry>(session);
        registry->bind();
    }
    ~Rig() {
        session->disconnect();
    }
};

SensorConfig stored_config(test::MockGlove& glove) {
    const std::vector<std::uint8_t> raw = glove.value(CharId::config);
    SensorConfig cfg;
    codec::decode_config(raw.data(), raw.size(), cfg);
    return cfg;
}

std::ptrdiff_t index_of(const std::vector<std::string>& ops, const std::string& op) {
    auto it = std::find(ops.begin(), ops.end(), op);
    return it == ops.end() ? -1 : it - ops.begin();
}

} // namespace

static void test_refresh_on_connect() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);
    VRGLOVE_CHECK(rig.registry->config_known());
    VRGLOVE_CHECK(rig.registry->config() == SensorConfig());

    const DeviceInfo info = rig.registry->device_info();
    VRGLOVE_CHECK(info.firmware == "1.4.2");
    VRGLOVE_CHECK(info.model == "VR Glove");
    VRGLOVE_CHECK(info.manufacturer == "Degap");

    // Clock was set during the ready hook.
    std::uint32_t device_time = 0;
    const std::vector<std::uint8_t> ts = rig.glove->value(CharId::timestamp);
    codec::decode_timestamp(ts.data(), ts.size(), device_time);
    VRGLOVE_CHECK(device_time > 1600000000u);
}

static void test_change_committed_from_ack() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);

    int notified = 0;
    rig.registry->add_config_listener([&notified](const SensorConfig&) { ++notified; });

    ConfigChange change;
    change.imu = 1;
    change.field = ConfigField::accel_range;
    change.value = 8.0f;
    SensorConfig applied;
    VRGLOVE_CHECK(rig.registry->request_config(change, &applied) == ErrorCode::ok);
    VRGLOVE_CHECK(applied.imu[0].accel_range_g == 8.0f);
    VRGLOVE_CHECK(rig.registry->config().imu[0].accel_range_g == 8.0f);
    VRGLOVE_CHECK(stored_config(*rig.glove).imu[0].accel_range_g == 8.0f);
    VRGLOVE_CHECK(notified == 1);

    // Device caps the gyro at 500 dps: the registry reflects the device.
    rig.glove->set_config_filter([](std::vector<std::uint8_t>& bytes) {
        if (bytes[GattProtocol::CFG_IMU2_GYRO_RANGE_POS] > 2) bytes[GattProtocol::CFG_IMU2_GYRO_RANGE_POS] = 2;
    });
    change.imu = 2;
    change.field = ConfigField::gyro_range;
    change.value = 2000.0f;
    VRGLOVE_CHECK(rig.registry->request_config(change, &applied) == ErrorCode::ok);
    VRGLOVE_CHECK(applied.imu[1].gyro_range_dps == 500.0f);
    VRGLOVE_CHECK(rig.registry->config().imu[1].gyro_range_dps == 500.0f);
}

static void test_rejections() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);
    rig.glove->clear_ops();

    ConfigChange change;
    change.field = ConfigField::accel_gyro_rate;
    change.value = 100.0f;
    VRGLOVE_CHECK(rig.registry->request_config(change) == ErrorCode::invalid_config);
    VRGLOVE_CHECK(index_of(rig.glove->ops(), "write:config") < 0);

    SensorConfig bad;
    bad.update_rate_ms = 0;
    VRGLOVE_CHECK(rig.registry->request_config(bad) == ErrorCode::invalid_config);
    VRGLOVE_CHECK(index_of(rig.glove->ops(), "write:config") < 0);

    const SensorConfig before = rig.registry->config();
    rig.glove->set_reject_writes(true);
    change.value = 208.0f;
    VRGLOVE_CHECK(rig.registry->request_config(change) == ErrorCode::write_rejected);
    VRGLOVE_CHECK(rig.registry->config() == before);
    rig.glove->set_reject_writes(false);
}

static void test_one_write_in_flight() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);

    rig.glove->set_block_writes(true);
    ConfigChange first;
    first.field = ConfigField::mag_rate;
    first.value = 20.0f;
    ErrorCode first_rc = ErrorCode::cancelled;
    std::thread writer([&] { first_rc = rig.registry->request_config(first); });

    VRGLOVE_CHECK(test::wait_for([&] { return index_of(rig.glove->ops(), "write:config") >= 0; }));
    ConfigChange second;
    second.imu = 2;
    second.field = ConfigField::accel_gyro_rate;
    second.value = 416.0f;
    VRGLOVE_CHECK(rig.registry->request_config(second) == ErrorCode::device_busy);
    VRGLOVE_CHECK(rig.registry->device_command(GattProtocol::Command::calibrate_imu1) == ErrorCode::device_busy);

    rig.glove->set_block_writes(false);
    writer.join();
    VRGLOVE_CHECK(first_rc == ErrorCode::ok);
    VRGLOVE_CHECK(rig.registry->config().imu[0].mag_rate_hz == 20.0f);

    // The retry builds on the first change instead of reverting it.
    VRGLOVE_CHECK(rig.registry->request_config(second) == ErrorCode::ok);
    const SensorConfig device = stored_config(*rig.glove);
    VRGLOVE_CHECK(device.imu[0].mag_rate_hz == 20.0f);
    VRGLOVE_CHECK(device.imu[1].accel_gyro_rate_hz == 416.0f);
    VRGLOVE_CHECK(rig.registry->config() == device);
}

static void test_concurrent_requests_never_revert() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);

    // Two threads hammer different fields; every accepted change must survive.
    std::atomic<int> imu1_done{0}, imu2_done{0};
    auto worker = [&rig](int imu, ConfigField field, float value, std::atomic<int>& done) {
        ConfigChange change;
        change.imu = imu;
        change.field = field;
        change.value = value;
        for (int i = 0; i < 500 && done.load() == 0; ++i) {
            const ErrorCode rc = rig.registry->request_config(change);
            if (rc == ErrorCode::ok) ++done;
            else std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    };
    std::thread a(worker, 1, ConfigField::accel_range, 16.0f, std::ref(imu1_done));
    std::thread b(worker, 2, ConfigField::gyro_range, 125.0f, std::ref(imu2_done));
    a.join();
    b.join();

    VRGLOVE_CHECK(imu1_done.load() == 1 && imu2_done.load() == 1);
    const SensorConfig device = stored_config(*rig.glove);
    VRGLOVE_CHECK(device.imu[0].accel_range_g == 16.0f);
    VRGLOVE_CHECK(device.imu[1].gyro_range_dps == 125.0f);
    VRGLOVE_CHECK(rig.registry->config() == device);
}

static void test_reapplied_after_link_loss() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);
    VRGLOVE_CHECK(rig.session->subscribe(CharId::imu1_raw) == ErrorCode::ok);

    ConfigChange change;
    change.imu = 2;
    change.field = ConfigField::accel_gyro_rate;
    change.value = 416.0f;
    VRGLOVE_CHECK(rig.registry->request_config(change) == ErrorCode::ok);
    VRGLOVE_CHECK(rig.registry->device_command(GattProtocol::Command::calibrate_imu2) == ErrorCode::ok);

    // Power cycle: device forgets everything.
    std::vector<std::uint8_t> defaults;
    codec::encode_config(SensorConfig(), defaults);
    rig.glove->set_value(CharId::config, defaults);
    rig.glove->clear_ops();
    rig.glove->drop_link();

    VRGLOVE_CHECK(test::wait_for([&] {
        return rig.session->state() == SessionState::ready && rig.glove->notifying(CharId::imu1_raw);
    }));

    const SensorConfig restored = stored_config(*rig.glove);
    VRGLOVE_CHECK(restored.imu[1].accel_gyro_rate_hz == 416.0f);
    // The one-shot calibration is not replayed.
    VRGLOVE_CHECK(restored.command == static_cast<std::uint8_t>(GattProtocol::Command::run));

    const auto ops = rig.glove->ops();
    const auto write_at = index_of(ops, "write:config");
    const auto notify_at = index_of(ops, "notify:imu1_raw:1");
    VRGLOVE_CHECK(write_at >= 0 && notify_at >= 0);
    VRGLOVE_CHECK(write_at < notify_at);
}

static void test_rejected_reapply_adopts_device_config() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);
    VRGLOVE_CHECK(rig.session->subscribe(CharId::imu1_raw) == ErrorCode::ok);

    std::atomic<int> rejected{0};
    SensorConfig last_notified;
    std::mutex notified_mutex;
    rig.registry->add_loss_listener([&rejected](ErrorCode rc) {
        if (rc == ErrorCode::write_rejected) ++rejected;
    });
    rig.registry->add_config_listener([&](const SensorConfig& cfg) {
        std::lock_guard<std::mutex> lock(notified_mutex);
        last_notified = cfg;
    });

    ConfigChange change;
    change.imu = 2;
    change.field = ConfigField::accel_gyro_rate;
    change.value = 416.0f;
    VRGLOVE_CHECK(rig.registry->request_config(change) == ErrorCode::ok);

    // Power cycle, and the device refuses the restore.
    std::vector<std::uint8_t> defaults;
    codec::encode_config(SensorConfig(), defaults);
    rig.glove->set_value(CharId::config, defaults);
    rig.glove->set_reject_writes(true);
    rig.glove->drop_link();

    VRGLOVE_CHECK(test::wait_for([&] {
        return rig.session->state() == SessionState::ready &&
               rig.registry->last_error() == ErrorCode::write_rejected;
    }));
    VRGLOVE_CHECK(rejected.load() == 1);

    const SensorConfig device = stored_config(*rig.glove);
    VRGLOVE_CHECK(device.imu[1].accel_gyro_rate_hz != 416.0f);
    VRGLOVE_CHECK(rig.registry->config() == device);
    {
        std::lock_guard<std::mutex> lock(notified_mutex);
        VRGLOVE_CHECK(last_notified == device);
    }
    rig.glove->set_reject_writes(false);
}

static void test_loss_surfaces() {
    Rig rig;
    VRGLOVE_CHECK(rig.session->connect(rig.glove->device()) == ErrorCode::ok);

    std::atomic<int> losses{0};
    rig.registry->add_loss_listener([&losses](ErrorCode rc) {
        if (rc == ErrorCode::connection_lost) ++losses;
    });

    ConfigChange change;
    change.field = ConfigField::accel_range;
    change.value = 16.0f;
    VRGLOVE_CHECK(rig.registry->request_config(change) == ErrorCode::ok);

    rig.glove->set_advertising(false);
    rig.glove->drop_link();
    VRGLOVE_CHECK(test::wait_for([&] { return losses.load() == 1; }));
    VRGLOVE_CHECK(rig.registry->last_error() == ErrorCode::connection_lost);
    VRGLOVE_CHECK(rig.session->state() == SessionState::idle);
    // Last acknowledged config survives for the next session.
    VRGLOVE_CHECK(rig.registry->config().imu[0].accel_range_g == 16.0f);
    VRGLOVE_CHECK(rig.registry->request_config(change) == ErrorCode::not_connected);
}

int main() {
    VRGLOVE_LOG_INFO(test::logger()) << "=== config registry ===";
    test_refresh_on_connect();
    test_change_committed_from_ack();
    test_rejections();
    test_one_write_in_flight();
    test_concurrent_requests_never_revert();
    test_reapplied_after_link_loss();
    test_rejected_reapply_adopts_device_config();
    test_loss_surfaces();
    return test::report("test_registry");
}
