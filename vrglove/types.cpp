#include "types.hpp"

#include <cmath>

namespace vrglove {

static const char* const kSourceTags[kSourceCount] = {
    "imu1", "imu2", "imu1_euler", "imu2_euler", "joystick", "buttons",
    "pressure", "flex", "battery", "charging", "status"
};

const char* source_tag(SourceId id) {
    const auto idx = static_cast<std::size_t>(id);
    return idx < kSourceCount ? kSourceTags[idx] : "unknown";
}

bool source_from_tag(const std::string& tag, SourceId& out) {
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        if (tag == kSourceTags[i]) {
            out = static_cast<SourceId>(i);
            return true;
        }
    }
    return false;
}

const char* unit_name(Unit unit) {
    switch (unit) {
    case Unit::mg:      return "mg";
    case Unit::rad_s:   return "rad/s";
    case Unit::ut:      return "uT";
    case Unit::deg:     return "deg";
    case Unit::counts:  return "counts";
    case Unit::percent: return "%";
    case Unit::kohm:    return "kOhm";
    case Unit::state:   return "state";
    default:            return "";
    }
}

const std::vector<ChannelInfo>& channel_layout(SourceId id) {
    static const std::vector<ChannelInfo> imu = {
        {"ax", Unit::mg},    {"ay", Unit::mg},    {"az", Unit::mg},
        {"gx", Unit::rad_s}, {"gy", Unit::rad_s}, {"gz", Unit::rad_s},
        {"mx", Unit::ut},    {"my", Unit::ut},    {"mz", Unit::ut}
    };
    static const std::vector<ChannelInfo> euler = {
        {"yaw", Unit::deg}, {"pitch", Unit::deg}, {"roll", Unit::deg},
        {"calib_status", Unit::state}
    };
    static const std::vector<ChannelInfo> joystick = {
        {"x", Unit::counts}, {"y", Unit::counts},
        {"x_pct", Unit::percent}, {"y_pct", Unit::percent},
        {"button", Unit::state}
    };
    static const std::vector<ChannelInfo> buttons = {
        {"b1", Unit::state}, {"b2", Unit::state}, {"b3", Unit::state}, {"b4", Unit::state}
    };
    static const std::vector<ChannelInfo> pressure = {{"force", Unit::kohm}};
    static const std::vector<ChannelInfo> flex = {
        {"f1", Unit::kohm}, {"f2", Unit::kohm}, {"f3", Unit::kohm},
        {"f4", Unit::kohm}, {"f5", Unit::kohm}
    };
    static const std::vector<ChannelInfo> battery  = {{"level", Unit::percent}};
    static const std::vector<ChannelInfo> charging = {{"charging", Unit::state}};
    static const std::vector<ChannelInfo> status = {
        {"error", Unit::state}, {"fuel_gauge", Unit::state},
        {"imu1", Unit::state},  {"imu2", Unit::state}
    };
    static const std::vector<ChannelInfo> empty;

    switch (id) {
    case SourceId::imu1:
    case SourceId::imu2:       return imu;
    case SourceId::imu1_euler:
    case SourceId::imu2_euler: return euler;
    case SourceId::joystick:   return joystick;
    case SourceId::buttons:    return buttons;
    case SourceId::pressure:   return pressure;
    case SourceId::flex:       return flex;
    case SourceId::battery:    return battery;
    case SourceId::charging:   return charging;
    case SourceId::status:     return status;
    default:                   return empty;
    }
}

CharId source_char(SourceId id) {
    switch (id) {
    case SourceId::imu1:       return CharId::imu1_raw;
    case SourceId::imu2:       return CharId::imu2_raw;
    case SourceId::imu1_euler: return CharId::imu1_euler;
    case SourceId::imu2_euler: return CharId::imu2_euler;
    case SourceId::joystick:   return CharId::joystick;
    case SourceId::buttons:    return CharId::buttons;
    case SourceId::pressure:   return CharId::force;
    case SourceId::flex:       return CharId::flex;
    case SourceId::battery:    return CharId::battery_level;
    case SourceId::charging:   return CharId::battery_charging;
    case SourceId::status:     return CharId::overall_status;
    default:                   return CharId::count;
    }
}

bool char_source(CharId id, SourceId& out) {
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        const auto src = static_cast<SourceId>(i);
        if (source_char(src) == id) {
            out = src;
            return true;
        }
    }
    return false;
}

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::idle:              return "Idle";
    case SessionState::scanning:          return "Scanning";
    case SessionState::discovered:        return "Discovered";
    case SessionState::connecting:        return "Connecting";
    case SessionState::service_discovery: return "ServiceDiscovery";
    case SessionState::ready:             return "Ready";
    case SessionState::disconnected:      return "Disconnected";
    case SessionState::reconnecting:      return "Reconnecting";
    }
    return "Unknown";
}

static inline bool same(float a, float b) {
    return std::fabs(a - b) < 1e-4f;
}

bool operator==(const ImuConfig& a, const ImuConfig& b) {
    return same(a.accel_gyro_rate_hz, b.accel_gyro_rate_hz) &&
           same(a.mag_rate_hz, b.mag_rate_hz) &&
           same(a.accel_range_g, b.accel_range_g) &&
           same(a.gyro_range_dps, b.gyro_range_dps) &&
           same(a.mag_range_gauss, b.mag_range_gauss);
}

bool operator!=(const ImuConfig& a, const ImuConfig& b) {
    return !(a == b);
}

bool operator==(const SensorConfig& a, const SensorConfig& b) {
    return a.command == b.command &&
           a.imu[0] == b.imu[0] &&
           a.imu[1] == b.imu[1] &&
           a.update_rate_ms == b.update_rate_ms;
}

bool operator!=(const SensorConfig& a, const SensorConfig& b) {
    return !(a == b);
}

} // namespace vrglove
