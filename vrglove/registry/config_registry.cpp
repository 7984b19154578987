// vrglove/registry/config_registry.cpp
#include "config_registry.hpp"
#include "../codec/characteristic_codec.hpp"
#include "../transport/transport_session.hpp"
#include "../log.h"

#include <ctime>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("registry");

static bool link_failure(ErrorCode rc) {
    return rc == ErrorCode::connection_lost || rc == ErrorCode::not_connected ||
           rc == ErrorCode::cancelled;
}

ConfigRegistry::ConfigRegistry(std::shared_ptr<TransportSession> session)
    : session_(std::move(session))
{}

void ConfigRegistry::bind() {
    session_->set_ready_hook([this](bool reconnect) { return on_ready(reconnect); });
    session_->add_state_listener([this](SessionState state, ErrorCode reason) { on_state(state, reason); });
}

// -----------------------------------------------------------------------------
// Writes
// -----------------------------------------------------------------------------
// Holds the in-flight slot of one characteristic for a whole
// read-modify-write, so a second request cannot build on a stale snapshot.
class ConfigRegistry::WriteSlot {
public:
    WriteSlot(ConfigRegistry& registry, CharId id)
        : registry_(registry), idx_(static_cast<std::size_t>(id)) {
        std::lock_guard<std::mutex> lock(registry_.mutex_);
        if (registry_.in_flight_[idx_]) {
            VRGLOVE_LOG_WARN(g_logger) << "write to " << char_info(id).name << " already in flight";
            return;
        }
        registry_.in_flight_[idx_] = true;
        held_ = true;
    }
    ~WriteSlot() {
        if (!held_) return;
        std::lock_guard<std::mutex> lock(registry_.mutex_);
        registry_.in_flight_[idx_] = false;
    }
    bool held() const { return held_; }

private:
    ConfigRegistry& registry_;
    std::size_t     idx_;
    bool            held_ = false;
};

ErrorCode ConfigRegistry::commit_config(const SensorConfig& desired, SensorConfig* applied) {
    std::vector<std::uint8_t> bytes;
    ErrorCode rc = codec::encode_config(desired, bytes);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "rejected config before transmission: " << to_string(rc);
        return rc;
    }

    std::vector<std::uint8_t> ack;
    rc = session_->write_config(CharId::config, bytes, ack);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "config write failed: " << to_string(rc);
        return rc;
    }

    SensorConfig acked;
    rc = codec::decode_config(ack.data(), ack.size(), acked);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "config read-back of " << ack.size() << " bytes not decodable";
        return rc;
    }
    if (acked != desired) {
        VRGLOVE_LOG_WARN(g_logger) << "device acknowledged a config different from the request";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = acked;
        config_known_ = true;
    }
    if (applied) *applied = acked;
    VRGLOVE_LOG_INFO(g_logger) << "config committed: imu1 " << acked.imu[0].accel_gyro_rate_hz << " Hz "
                               << acked.imu[0].accel_range_g << " G " << acked.imu[0].gyro_range_dps << " dps, imu2 "
                               << acked.imu[1].accel_gyro_rate_hz << " Hz, period " << acked.update_rate_ms << " ms";
    notify_config(acked);
    return ErrorCode::ok;
}

ErrorCode ConfigRegistry::request_config(const ConfigChange& change, SensorConfig* applied) {
    WriteSlot slot(*this, CharId::config);
    if (!slot.held()) return ErrorCode::device_busy;

    if (!config_known()) {
        ErrorCode rc = refresh();
        if (rc != ErrorCode::ok) return rc;
    }
    SensorConfig desired = config();
    ErrorCode rc = codec::apply_change(change, desired);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "invalid change for imu" << change.imu << ": " << change.value;
        return rc;
    }
    return commit_config(desired, applied);
}

ErrorCode ConfigRegistry::request_config(const SensorConfig& desired, SensorConfig* applied) {
    ErrorCode rc = codec::validate_config(desired);
    if (rc != ErrorCode::ok) return rc;

    WriteSlot slot(*this, CharId::config);
    if (!slot.held()) return ErrorCode::device_busy;
    return commit_config(desired, applied);
}

ErrorCode ConfigRegistry::device_command(GattProtocol::Command command) {
    WriteSlot slot(*this, CharId::config);
    if (!slot.held()) return ErrorCode::device_busy;

    if (!config_known()) {
        ErrorCode rc = refresh();
        if (rc != ErrorCode::ok) return rc;
    }
    SensorConfig desired = config();
    desired.command = static_cast<std::uint8_t>(command);
    VRGLOVE_LOG_INFO(g_logger) << "device command " << static_cast<int>(desired.command);
    return commit_config(desired, nullptr);
}

ErrorCode ConfigRegistry::reapply() {
    WriteSlot slot(*this, CharId::config);
    if (!slot.held()) return ErrorCode::device_busy;

    if (!config_known()) return ErrorCode::ok;
    SensorConfig desired = config();
    // A calibration command is a one-shot, not part of the persistent state.
    if (desired.command != static_cast<std::uint8_t>(GattProtocol::Command::idle)) {
        desired.command = static_cast<std::uint8_t>(GattProtocol::Command::run);
    }
    VRGLOVE_LOG_INFO(g_logger) << "re-applying last acknowledged config";
    return commit_config(desired, nullptr);
}

ErrorCode ConfigRegistry::sync_time(std::uint32_t* device_time) {
    const std::uint32_t now = static_cast<std::uint32_t>(std::time(nullptr));
    std::vector<std::uint8_t> bytes;
    codec::encode_timestamp(now, bytes);

    WriteSlot slot(*this, CharId::timestamp);
    if (!slot.held()) return ErrorCode::device_busy;

    std::vector<std::uint8_t> ack;
    ErrorCode rc = session_->write_config(CharId::timestamp, bytes, ack);
    if (rc != ErrorCode::ok) return rc;

    std::uint32_t reported = 0;
    rc = codec::decode_timestamp(ack.data(), ack.size(), reported);
    if (rc != ErrorCode::ok) return rc;
    if (device_time) *device_time = reported;

    VRGLOVE_LOG_INFO(g_logger) << "device clock set, skew "
                               << static_cast<long long>(reported) - static_cast<long long>(now) << " s";
    return ErrorCode::ok;
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
ErrorCode ConfigRegistry::read_device_info() {
    struct Field { CharId id; std::string DeviceInfo::*member; };
    static const Field kFields[] = {
        {CharId::firmware,     &DeviceInfo::firmware},
        {CharId::hardware,     &DeviceInfo::hardware},
        {CharId::model,        &DeviceInfo::model},
        {CharId::manufacturer, &DeviceInfo::manufacturer},
    };

    DeviceInfo info;
    ErrorCode result = ErrorCode::ok;
    for (const Field& f : kFields) {
        if (!session_->has_characteristic(f.id)) continue;
        std::vector<std::uint8_t> raw;
        ErrorCode rc = session_->read(f.id, raw);
        if (rc == ErrorCode::ok) {
            rc = codec::decode_string(raw.data(), raw.size(), info.*f.member);
        }
        if (rc != ErrorCode::ok) {
            VRGLOVE_LOG_WARN(g_logger) << "read " << char_info(f.id).name << ": " << to_string(rc);
            if (link_failure(rc)) return rc;
            result = rc;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        info_ = info;
    }
    VRGLOVE_LOG_INFO(g_logger) << "device " << info.model << " by " << info.manufacturer
                               << ", firmware " << info.firmware << ", hardware " << info.hardware;
    return result;
}

ErrorCode ConfigRegistry::refresh() {
    ErrorCode rc = read_device_info();
    if (link_failure(rc)) return rc;

    std::vector<std::uint8_t> raw;
    rc = session_->read(CharId::config, raw);
    if (rc != ErrorCode::ok) return rc;

    SensorConfig current;
    rc = codec::decode_config(raw.data(), raw.size(), current);
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_WARN(g_logger) << "config characteristic not decodable (" << raw.size() << " bytes)";
        return rc;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = current;
        config_known_ = true;
    }
    notify_config(current);
    return ErrorCode::ok;
}

ErrorCode ConfigRegistry::on_ready(bool reconnect) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_error_ = ErrorCode::ok;
    }

    ErrorCode rc;
    if (reconnect && config_known()) {
        rc = read_device_info();
        if (link_failure(rc)) return rc;
        rc = reapply();
        if (rc != ErrorCode::ok && !link_failure(rc)) {
            // The device runs whatever it reset to; record that, not our wish.
            VRGLOVE_LOG_ERROR(g_logger) << "re-apply failed: " << to_string(rc)
                                        << ", adopting the device's config";
            ErrorCode fr = refresh();
            if (link_failure(fr)) return fr;
            if (fr != ErrorCode::ok) {
                VRGLOVE_LOG_ERROR(g_logger) << "device config unreadable: " << to_string(fr);
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ready_error_ = rc;
            }
            notify_loss(rc);
            rc = ErrorCode::ok;
        }
    } else {
        rc = refresh();
    }
    if (rc != ErrorCode::ok) {
        VRGLOVE_LOG_ERROR(g_logger) << (reconnect ? "re-apply" : "refresh") << " failed: " << to_string(rc);
        if (link_failure(rc)) return rc;
    }

    if (session_->has_characteristic(CharId::timestamp)) {
        ErrorCode tr = sync_time();
        if (tr != ErrorCode::ok) {
            VRGLOVE_LOG_WARN(g_logger) << "time sync failed: " << to_string(tr);
        }
    }
    return ErrorCode::ok;
}

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------
void ConfigRegistry::on_state(SessionState state, ErrorCode reason) {
    if (state == SessionState::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = ready_error_;
        return;
    }
    if (state != SessionState::idle || reason != ErrorCode::connection_lost) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = ErrorCode::connection_lost;
    }
    VRGLOVE_LOG_ERROR(g_logger) << "connection lost, keeping last acknowledged config";
    notify_loss(ErrorCode::connection_lost);
}

void ConfigRegistry::notify_loss(ErrorCode reason) {
    std::vector<LossListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = loss_listeners_;
    }
    for (auto& l : listeners) l(reason);
}

void ConfigRegistry::notify_config(const SensorConfig& config) {
    std::vector<ConfigListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = config_listeners_;
    }
    for (auto& l : listeners) l(config);
}

SensorConfig ConfigRegistry::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

bool ConfigRegistry::config_known() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_known_;
}

DeviceInfo ConfigRegistry::device_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

ErrorCode ConfigRegistry::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void ConfigRegistry::add_config_listener(ConfigListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    config_listeners_.push_back(std::move(listener));
}

void ConfigRegistry::add_loss_listener(LossListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    loss_listeners_.push_back(std::move(listener));
}

} // namespace vrglove
