#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "protocol_data.hpp"

namespace vrglove {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// =======================
// Sources / channels
// =======================

enum class SourceId : std::uint8_t {
    imu1 = 0,
    imu2,
    imu1_euler,
    imu2_euler,
    joystick,
    buttons,
    pressure,
    flex,
    battery,
    charging,
    status,
    count
};

constexpr std::size_t kSourceCount = static_cast<std::size_t>(SourceId::count);

enum class Unit : std::uint8_t {
    none = 0,
    mg,         // accelerometer
    rad_s,      // gyroscope
    ut,         // magnetometer, micro tesla
    deg,
    counts,     // joystick ADC
    percent,
    kohm,
    state
};

struct ChannelInfo {
    const char* name;
    Unit        unit;
};

const char* source_tag(SourceId id);
const char* unit_name(Unit unit);
bool        source_from_tag(const std::string& tag, SourceId& out);

// Channel layout of the decoded payload vector for a source.
const std::vector<ChannelInfo>& channel_layout(SourceId id);

// Characteristic a source is decoded from.
CharId source_char(SourceId id);
bool   char_source(CharId id, SourceId& out);

// =======================
// Frames
// =======================

// One decoded telemetry unit. Immutable once published by the router.
struct SensorFrame {
    SourceId            source = SourceId::imu1;
    TimePoint           timestamp;              // host capture time
    bool                has_seq = false;        // device-side counter
    std::uint32_t       seq = 0;
    std::vector<float>  raw;                    // decoded, uncorrected
    std::vector<float>  values;                 // corrected (== raw without profile)
    bool                valid = true;
    bool                calibrated = false;
};

using FramePtr = std::shared_ptr<const SensorFrame>;

// Raw notification as it leaves the transport session.
struct RawNotification {
    CharId                      characteristic = CharId::imu1_raw;
    std::vector<std::uint8_t>   payload;
    TimePoint                   timestamp;
};

// =======================
// Configuration
// =======================

struct ImuConfig {
    float accel_gyro_rate_hz = 104.0f;
    float mag_rate_hz        = 10.0f;
    float accel_range_g      = 4.0f;
    float gyro_range_dps     = 500.0f;
    float mag_range_gauss    = 4.0f;
};

struct SensorConfig {
    std::uint8_t  command        = 1;        // GattProtocol::Command
    ImuConfig     imu[2];
    std::uint16_t update_rate_ms = 20;
};

bool operator==(const ImuConfig& a, const ImuConfig& b);
bool operator!=(const ImuConfig& a, const ImuConfig& b);
bool operator==(const SensorConfig& a, const SensorConfig& b);
bool operator!=(const SensorConfig& a, const SensorConfig& b);

enum class ConfigField : std::uint8_t {
    accel_gyro_rate,
    mag_rate,
    accel_range,
    gyro_range,
    mag_range
};

// A single-field change requested by the UI/CLI. imu is 1 or 2.
struct ConfigChange {
    int         imu   = 1;
    ConfigField field = ConfigField::accel_gyro_rate;
    float       value = 0.0f;
};

struct DeviceInfo {
    std::string firmware;
    std::string hardware;
    std::string model;
    std::string manufacturer;
};

// =======================
// Session
// =======================

struct DeviceHandle {
    std::string address;
    std::string name;
    int         rssi = 0;
};

enum class SessionState : std::uint8_t {
    idle = 0,
    scanning,
    discovered,
    connecting,
    service_discovery,
    ready,
    disconnected,
    reconnecting
};

const char* to_string(SessionState state);

struct DeviceSession {
    DeviceHandle                          device;
    SessionState                          state = SessionState::idle;
    int                                   rssi = 0;
    std::array<std::uint16_t, kCharCount> handles{};   // 0 = not discovered
};

// =======================
// Calibration
// =======================

struct CalibrationProfile {
    SourceId            source = SourceId::imu1;
    std::vector<float>  offset;
    std::vector<float>  scale;
    float               drift = 0.0f;         // fraction of full scale
    std::int64_t        calibrated_at_ms = 0; // unix epoch
    std::uint32_t       samples = 0;
};

} // namespace vrglove
