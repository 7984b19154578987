#include "vrglove/transport/transport_session.hpp"
#include "mock_glove.hpp"
#include "test_common.hpp"

#include <algorithm>
#include <thread>
#include <utility>

using namespace vrglove;

namespace {

// Thread-safe record of state transitions.
class StateLog {
public:
    void attach(TransportSession& session) {
        session.add_state_listener([this](SessionState s, ErrorCode rc) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.emplace_back(s, rc);
        });
    }
    std::vector<std::pair<SessionState, ErrorCode>> entries() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }
    bool saw(SessionState s, ErrorCode rc = ErrorCode::ok) {
        auto e = entries();
        return std::find(e.begin(), e.end(), std::make_pair(s, rc)) != e.end();
    }

private:
    std::mutex                                      mutex_;
    std::vector<std::pair<SessionState, ErrorCode>> entries_;
};

} // namespace

static void test_normalize_uuid() {
    VRGLOVE_CHECK(normalize_uuid("00002A19-0000-1000-8000-00805F9B34FB") == "2a19");
    VRGLOVE_CHECK(normalize_uuid("6E401001-B5A3-F393-E0A9-E50E24DCCA9E") == "6e401001-b5a3-f393-e0a9-e50e24dcca9e");
    VRGLOVE_CHECK(normalize_uuid("2A26") == "2a26");
}

static void test_discover_and_stream() {
    auto glove = std::make_shared<test::MockGlove>();
    TransportSession session(glove, test::fast_transport_options());
    StateLog log;
    log.attach(session);

    std::vector<DeviceHandle> found;
    VRGLOVE_CHECK(session.discover(found) == ErrorCode::ok);
    VRGLOVE_CHECK(found.size() == 1);
    if (found.empty()) return;
    VRGLOVE_CHECK(found[0].address == glove->device().address);
    VRGLOVE_CHECK(session.state() == SessionState::discovered);

    VRGLOVE_CHECK(session.connect(found[0]) == ErrorCode::ok);
    VRGLOVE_CHECK(session.state() == SessionState::ready);
    VRGLOVE_CHECK(log.saw(SessionState::service_discovery));
    VRGLOVE_CHECK(session.has_characteristic(CharId::battery_level));   // long-form uuid
    VRGLOVE_CHECK(session.snapshot().device.address == glove->device().address);

    // A second connect while ready is refused.
    VRGLOVE_CHECK(session.connect(found[0]) == ErrorCode::device_busy);

    VRGLOVE_CHECK(session.subscribe(CharId::imu1_raw) == ErrorCode::ok);
    VRGLOVE_CHECK(session.subscribe(CharId::firmware) == ErrorCode::invalid_argument);

    // First enable attempt fails, the retry goes through.
    glove->fail_next_notifies(1);
    VRGLOVE_CHECK(session.subscribe(CharId::joystick) == ErrorCode::ok);
    VRGLOVE_CHECK(glove->notifying(CharId::joystick));

    const auto payload = test::imu_payload(1, 2, 3);
    VRGLOVE_CHECK(glove->notify(CharId::imu1_raw, payload));
    RawNotification note;
    VRGLOVE_CHECK(session.notifications()->pop(note, std::chrono::milliseconds(1000)));
    VRGLOVE_CHECK(note.characteristic == CharId::imu1_raw);
    VRGLOVE_CHECK(note.payload == payload);

    std::vector<std::uint8_t> battery;
    VRGLOVE_CHECK(session.read(CharId::battery_level, battery) == ErrorCode::ok);
    VRGLOVE_CHECK(battery.size() == 1 && battery[0] == 87);

    VRGLOVE_CHECK(session.unsubscribe(CharId::joystick) == ErrorCode::ok);
    VRGLOVE_CHECK(!glove->notifying(CharId::joystick));

    session.disconnect();
    VRGLOVE_CHECK(session.state() == SessionState::idle);
    VRGLOVE_CHECK(!glove->is_connected());
    VRGLOVE_CHECK(log.saw(SessionState::disconnected));
    VRGLOVE_CHECK(session.read(CharId::battery_level, battery) == ErrorCode::not_connected);
}

static void test_missing_required_characteristic() {
    auto glove = std::make_shared<test::MockGlove>();
    glove->remove(CharId::imu2_raw);
    TransportSession session(glove, test::fast_transport_options());

    VRGLOVE_CHECK(session.connect(glove->device()) == ErrorCode::device_unreachable);
    VRGLOVE_CHECK(session.state() == SessionState::idle);
    VRGLOVE_CHECK(!glove->is_connected());
}

static void test_connect_attempts_bounded() {
    auto glove = std::make_shared<test::MockGlove>();
    glove->set_advertising(false);
    TransportSession session(glove, test::fast_transport_options());

    VRGLOVE_CHECK(session.connect(glove->device()) == ErrorCode::device_unreachable);
    VRGLOVE_CHECK(glove->connect_calls() == 3);
    VRGLOVE_CHECK(session.state() == SessionState::idle);
}

static void test_reconnect_restores_before_streaming() {
    auto glove = std::make_shared<test::MockGlove>();
    TransportSession session(glove, test::fast_transport_options());
    StateLog log;
    log.attach(session);

    // Stand-in for the config registry: writes config on every (re)connection.
    std::atomic<int> hook_calls{0};
    session.set_ready_hook([&](bool reconnect) {
        ++hook_calls;
        if (!reconnect) return ErrorCode::ok;
        std::vector<std::uint8_t> cfg = glove->value(CharId::config);
        std::vector<std::uint8_t> ack;
        return session.write_config(CharId::config, cfg, ack);
    });

    VRGLOVE_CHECK(session.connect(glove->device()) == ErrorCode::ok);
    VRGLOVE_CHECK(session.subscribe(CharId::imu1_raw) == ErrorCode::ok);
    VRGLOVE_CHECK(session.subscribe(CharId::imu2_raw) == ErrorCode::ok);

    glove->clear_ops();
    glove->drop_link();

    VRGLOVE_CHECK(test::wait_for([&] { return log.saw(SessionState::reconnecting, ErrorCode::connection_lost); }));
    VRGLOVE_CHECK(test::wait_for([&] {
        return session.state() == SessionState::ready && glove->notifying(CharId::imu2_raw);
    }));
    VRGLOVE_CHECK(hook_calls.load() == 2);
    VRGLOVE_CHECK(session.stats().link_losses == 1);
    VRGLOVE_CHECK(session.stats().reconnects == 1);

    const auto ops = glove->ops();
    auto write_it = std::find(ops.begin(), ops.end(), "write:config");
    auto notify_it = std::find(ops.begin(), ops.end(), "notify:imu1_raw:1");
    VRGLOVE_CHECK(write_it != ops.end() && notify_it != ops.end());
    VRGLOVE_CHECK(write_it < notify_it);

    // Streaming resumes on the same channel.
    VRGLOVE_CHECK(glove->notify(CharId::imu2_raw, test::imu_payload(7, 7, 7)));
    RawNotification note;
    VRGLOVE_CHECK(session.notifications()->pop(note, std::chrono::milliseconds(1000)));
    VRGLOVE_CHECK(note.characteristic == CharId::imu2_raw);

    session.disconnect();
}

static void test_reconnect_exhausted() {
    auto glove = std::make_shared<test::MockGlove>();
    TransportSession session(glove, test::fast_transport_options());
    StateLog log;
    log.attach(session);

    VRGLOVE_CHECK(session.connect(glove->device()) == ErrorCode::ok);
    VRGLOVE_CHECK(session.subscribe(CharId::imu1_raw) == ErrorCode::ok);

    glove->set_advertising(false);
    glove->drop_link();

    VRGLOVE_CHECK(test::wait_for([&] { return log.saw(SessionState::idle, ErrorCode::connection_lost); }));
    VRGLOVE_CHECK(session.state() == SessionState::idle);
    // 3 reconnect rounds of 3 connect attempts each, after the first connection.
    VRGLOVE_CHECK(glove->connect_calls() == 1 + 3 * 3);

    // Manual reconnect once the glove is back, subscriptions start fresh.
    glove->set_advertising(true);
    std::vector<DeviceHandle> found;
    VRGLOVE_CHECK(session.discover(found) == ErrorCode::ok);
    VRGLOVE_CHECK(session.connect(found.front()) == ErrorCode::ok);
    VRGLOVE_CHECK(!glove->notifying(CharId::imu1_raw));
    session.disconnect();
}

static void test_manual_reconnect() {
    auto glove = std::make_shared<test::MockGlove>();
    TransportSession session(glove, test::fast_transport_options());

    VRGLOVE_CHECK(session.reconnect() == ErrorCode::invalid_argument);   // nothing known yet
    VRGLOVE_CHECK(session.connect(glove->device()) == ErrorCode::ok);
    VRGLOVE_CHECK(session.subscribe(CharId::imu1_raw) == ErrorCode::ok);

    glove->clear_ops();
    VRGLOVE_CHECK(session.reconnect() == ErrorCode::ok);
    VRGLOVE_CHECK(session.state() == SessionState::ready);
    VRGLOVE_CHECK(glove->notifying(CharId::imu1_raw));
    const auto ops = glove->ops();
    VRGLOVE_CHECK(!ops.empty() && ops.front() == "scan");
    session.disconnect();
}

static void test_disconnect_cancels_pending_connect() {
    auto glove = std::make_shared<test::MockGlove>();
    TransportOptions options = test::fast_transport_options();
    options.connect_timeout = std::chrono::milliseconds(10000);
    TransportSession session(glove, options);

    glove->set_block_connect(true);
    ErrorCode rc = ErrorCode::ok;
    std::thread connector([&] { rc = session.connect(glove->device()); });
    VRGLOVE_CHECK(test::wait_for([&] { return glove->connect_calls() == 1; }));

    const auto start = Clock::now();
    session.disconnect();
    connector.join();
    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    VRGLOVE_CHECK(rc == ErrorCode::cancelled);
    VRGLOVE_CHECK(took.count() < 1000);
    VRGLOVE_CHECK(session.state() == SessionState::idle);
    VRGLOVE_CHECK(glove->connect_calls() == 1);

    glove->set_block_connect(false);
    VRGLOVE_CHECK(session.connect(glove->device()) == ErrorCode::ok);
    session.disconnect();
}

int main() {
    VRGLOVE_LOG_INFO(test::logger()) << "=== transport session ===";
    test_normalize_uuid();
    test_discover_and_stream();
    test_missing_required_characteristic();
    test_connect_attempts_bounded();
    test_reconnect_restores_before_streaming();
    test_reconnect_exhausted();
    test_manual_reconnect();
    test_disconnect_cancels_pending_connect();
    return test::report("test_transport");
}
